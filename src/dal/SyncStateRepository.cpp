#include "dal/SyncStateRepository.hpp"

#include "common/Errors.hpp"
#include "dal/ConnectionPool.hpp"

#include <pqxx/pqxx>

namespace ddns::dal {

SyncStateRepository::SyncStateRepository(ConnectionPool& cpPool) : _cpPool(cpPool) {}
SyncStateRepository::~SyncStateRepository() = default;

std::string SyncStateRepository::kindToString(common::SyncTaskKind kind) {
  return kind == common::SyncTaskKind::Register ? "register" : "update";
}

common::SyncTaskKind SyncStateRepository::kindFromString(const std::string& sKind) {
  if (sKind == "register") return common::SyncTaskKind::Register;
  if (sKind == "update") return common::SyncTaskKind::Update;
  throw common::ValidationError("invalid_task_kind", "Unknown sync task kind: " + sKind);
}

void SyncStateRepository::ensureSchema() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "CREATE TABLE IF NOT EXISTS sync_checkpoint ("
      "  id SMALLINT PRIMARY KEY CHECK (id = 1),"
      "  last_processed_height BIGINT NOT NULL,"
      "  updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW())");
  txn.exec(
      "CREATE TABLE IF NOT EXISTS sync_pending_tasks ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  kind TEXT NOT NULL,"
      "  domain_key TEXT NOT NULL,"
      "  content_ref TEXT NOT NULL,"
      "  source_height BIGINT NOT NULL,"
      "  retry_count INTEGER NOT NULL DEFAULT 0,"
      "  saved_at TIMESTAMPTZ NOT NULL DEFAULT NOW())");
  txn.exec(
      "CREATE TABLE IF NOT EXISTS sync_dead_letters ("
      "  id BIGSERIAL PRIMARY KEY,"
      "  kind TEXT NOT NULL,"
      "  domain_key TEXT NOT NULL,"
      "  content_ref TEXT NOT NULL,"
      "  source_height BIGINT NOT NULL,"
      "  retry_count INTEGER NOT NULL,"
      "  reason TEXT NOT NULL,"
      "  abandoned_at TIMESTAMPTZ NOT NULL DEFAULT NOW())");
  txn.commit();
}

std::optional<uint64_t> SyncStateRepository::loadCheckpoint() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec("SELECT last_processed_height FROM sync_checkpoint WHERE id = 1");
  txn.commit();
  if (result.empty()) return std::nullopt;
  return static_cast<uint64_t>(result[0][0].as<int64_t>());
}

void SyncStateRepository::saveCheckpoint(uint64_t uHeight) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO sync_checkpoint (id, last_processed_height) VALUES (1, $1) "
      "ON CONFLICT (id) DO UPDATE SET "
      "last_processed_height = EXCLUDED.last_processed_height, updated_at = NOW()",
      pqxx::params{static_cast<int64_t>(uHeight)});
  txn.commit();
}

void SyncStateRepository::savePending(const std::vector<common::SyncTask>& vTasks) {
  if (vTasks.empty()) return;

  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  for (const auto& st : vTasks) {
    txn.exec(
        "INSERT INTO sync_pending_tasks "
        "(kind, domain_key, content_ref, source_height, retry_count) "
        "VALUES ($1, $2, $3, $4, $5)",
        pqxx::params{kindToString(st.kind), st.sDomainKey, st.sContentRef,
                     static_cast<int64_t>(st.uSourceHeight), st.iRetryCount});
  }
  txn.commit();
}

std::vector<common::SyncTask> SyncStateRepository::takePending() {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  // Delete and read in one statement so two processes never both claim a row
  auto result = txn.exec(
      "WITH taken AS (DELETE FROM sync_pending_tasks "
      "RETURNING id, kind, domain_key, content_ref, source_height, retry_count) "
      "SELECT kind, domain_key, content_ref, source_height, retry_count "
      "FROM taken ORDER BY id");
  txn.commit();

  std::vector<common::SyncTask> vTasks;
  vTasks.reserve(result.size());
  for (const auto& row : result) {
    common::SyncTask st;
    st.kind = kindFromString(row[0].as<std::string>());
    st.sDomainKey = row[1].as<std::string>();
    st.sContentRef = row[2].as<std::string>();
    st.uSourceHeight = static_cast<uint64_t>(row[3].as<int64_t>());
    st.iRetryCount = row[4].as<int>();
    vTasks.push_back(std::move(st));
  }
  return vTasks;
}

void SyncStateRepository::recordAbandoned(const common::SyncTask& stTask,
                                          const std::string& sReason) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  txn.exec(
      "INSERT INTO sync_dead_letters "
      "(kind, domain_key, content_ref, source_height, retry_count, reason) "
      "VALUES ($1, $2, $3, $4, $5, $6)",
      pqxx::params{kindToString(stTask.kind), stTask.sDomainKey, stTask.sContentRef,
                   static_cast<int64_t>(stTask.uSourceHeight), stTask.iRetryCount, sReason});
  txn.commit();
}

std::vector<DeadLetterRow> SyncStateRepository::listAbandoned(int iLimit) {
  auto cg = _cpPool.checkout();
  pqxx::work txn(*cg);
  auto result = txn.exec(
      "SELECT id, kind, domain_key, content_ref, source_height, retry_count, reason, "
      "to_char(abandoned_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"') "
      "FROM sync_dead_letters ORDER BY id DESC LIMIT $1",
      pqxx::params{iLimit});
  txn.commit();

  std::vector<DeadLetterRow> vRows;
  vRows.reserve(result.size());
  for (const auto& row : result) {
    DeadLetterRow dlr;
    dlr.iId = row[0].as<int64_t>();
    dlr.stTask.kind = kindFromString(row[1].as<std::string>());
    dlr.stTask.sDomainKey = row[2].as<std::string>();
    dlr.stTask.sContentRef = row[3].as<std::string>();
    dlr.stTask.uSourceHeight = static_cast<uint64_t>(row[4].as<int64_t>());
    dlr.stTask.iRetryCount = row[5].as<int>();
    dlr.sReason = row[6].as<std::string>();
    dlr.sAbandonedAt = row[7].as<std::string>();
    vRows.push_back(std::move(dlr));
  }
  return vRows;
}

}  // namespace ddns::dal
