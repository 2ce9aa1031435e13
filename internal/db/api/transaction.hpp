#pragma once

namespace relations::db {

/*
  Abstract transaction (unit of work).

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - After Commit() all later transactions see the change
  - Rollback() discards all writes
  - Destructor rolls back if not committed

  SQLite:   BEGIN IMMEDIATE, one open transaction per connection
  Postgres: pqxx::work on a pooled connection
  Memory:   repository lock held for the lifetime + undo log
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace relations::db
