#include "sync/FullSyncStatus.h"
#include "sync/TableSyncModule.h"
#include <cassert>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

class UsersModule : public SyncModule {
public:
  std::string name() const override { return "users"; }
  std::string idField() const override { return "ID"; }
  std::string tableName() const override { return "wp_users"; }

  std::optional<json> getObjectById(const std::string &type,
                                    int64_t id) const override {
    if (type != "user" || id % 2 != 0)
      return std::nullopt;
    return json{{"id", id}, {"login", "user" + std::to_string(id)}};
  }
};

void testDefaults() {
  std::cout << "Testing SyncModule - defaults...\n";

  UsersModule users;
  assert(users.actionName() == "full_sync_users");
  assert(users.fullSyncActions() ==
         std::vector<std::string>({"full_sync_users"}));
  assert(users.whereClause(json::object()) == "1=1");
  assert(users.initialLastSent() == std::numeric_limits<int64_t>::max());
  assert(users.isAddressable());

  RecordScope scope = users.scope(json::object());
  assert(scope.table == "wp_users");
  assert(scope.idField == "ID");
  assert(scope.where == "1=1");

  std::cout << "✓ SyncModule defaults test passed\n";
}

void testGetObjectsByIdSkipsMissing() {
  std::cout << "Testing SyncModule - getObjectsById...\n";

  UsersModule users;
  auto objects = users.getObjectsById("user", {1, 2, 3, 4});
  assert(objects.size() == 2);
  assert(objects.at(2)["login"] == "user2");
  assert(objects.at(4)["id"] == 4);

  assert(users.getObjectsById("", {2}).empty());
  assert(users.getObjectsById("user", {}).empty());
  assert(users.getObjectsById("post", {2, 4}).empty());

  std::cout << "✓ SyncModule getObjectsById test passed\n";
}

void testCountActions() {
  std::cout << "Testing SyncModule - countActions...\n";

  std::vector<std::string> interesting = {"full_sync_posts",
                                          "full_sync_users"};
  assert(SyncModule::countActions(
             interesting, {"full_sync_users", "heartbeat",
                           "full_sync_posts"}) == 2);
  assert(SyncModule::countActions(interesting, {"heartbeat"}) == 0);
  assert(SyncModule::countActions({}, {"full_sync_posts"}) == 0);

  std::cout << "✓ SyncModule countActions test passed\n";
}

void testTableSyncModuleWhereClause() {
  std::cout << "Testing TableSyncModule - where clause...\n";

  TableSyncModule posts("posts", "wp_posts", "ID",
                        "post_status <> 'auto-draft'");
  assert(posts.whereClause(json::object()) == "post_status <> 'auto-draft'");
  assert(posts.whereClause(true) == "post_status <> 'auto-draft'");
  assert(posts.whereClause(json::array({4, 8})) ==
         "(post_status <> 'auto-draft') AND ID IN (4,8)");
  assert(posts.whereClause(json{{"ids", json::array({15})}}) ==
         "(post_status <> 'auto-draft') AND ID IN (15)");
  assert(posts.whereClause(json::array()) == "1=0");

  bool threw = false;
  try {
    posts.whereClause(json::array({1, "2; DROP TABLE wp_posts"}));
  } catch (const std::invalid_argument &) {
    threw = true;
  }
  assert(threw);

  std::cout << "✓ TableSyncModule where clause test passed\n";
}

void testTableSyncModuleFromJson() {
  std::cout << "Testing TableSyncModule - fromJson...\n";

  auto module = TableSyncModule::fromJson(
      json{{"name", "comments"}, {"table", "wp.comments"},
           {"id_field", "comment_ID"}});
  assert(module.name() == "comments");
  assert(module.tableName() == "wp.comments");
  assert(module.idField() == "comment_ID");
  assert(module.whereClause(json::object()) == "1=1");

  const json invalid[] = {
      json{{"name", "x"}},
      json{{"name", "x"}, {"table", "posts; DELETE"}},
      json{{"name", "x"}, {"table", "posts"}, {"id_field", "1id"}},
      json{{"name", ""}, {"table", "posts"}},
  };
  for (const auto &entry : invalid) {
    bool threw = false;
    try {
      TableSyncModule::fromJson(entry);
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "✓ TableSyncModule fromJson test passed\n";
}

void testStatusJson() {
  std::cout << "Testing FullSyncStatus - JSON form...\n";

  FullSyncStatus fresh;
  assert(fresh.toJson().dump() ==
         R"({"finished":false,"last_sent":null,"sent":0})");

  FullSyncStatus status =
      FullSyncStatus::fromJson(json::parse(R"({"last_sent":71,"sent":30})"));
  assert(status.lastSent == 71);
  assert(status.sent == 30);
  assert(!status.finished);
  assert(FullSyncStatus::fromJson(status.toJson()) == status);

  const char *invalid[] = {R"([])", R"({"last_sent":"~0"})",
                           R"({"sent":-1})"};
  for (const char *doc : invalid) {
    bool threw = false;
    try {
      FullSyncStatus::fromJson(json::parse(doc));
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    assert(threw);
  }

  std::cout << "✓ FullSyncStatus JSON test passed\n";
}

} // namespace

int main() {
  testDefaults();
  testGetObjectsByIdSkipsMissing();
  testCountActions();
  testTableSyncModuleWhereClause();
  testTableSyncModuleFromJson();
  testStatusJson();

  std::cout << "\nAll SyncModule tests passed\n";
  return 0;
}
