#include "sqlite_tx.hpp"

namespace relations::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  }
}

void SqliteTransaction::Commit() {
  if (committed_) return;
  db_->Exec("COMMIT;");
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (committed_) return;
  sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  committed_ = true;
  lock_.unlock();
}

} // namespace relations::db::sqlite
