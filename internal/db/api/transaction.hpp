#pragma once

namespace pgshadow::db {

/*
  Abstract transaction.

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  Every chunk, batch and the cutover run inside exactly one of these; none
  is ever held across units of work.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() finished
  virtual bool IsFinished() const = 0;
};

}
