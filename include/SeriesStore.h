/*************************************************************************
 * @file SeriesStore.h
 * @date 2026/10/19
 *
 ************************************************************************/

#ifndef PDL_SERIES_STORE_H
#define PDL_SERIES_STORE_H

/*************************************************************************
 * Includes
 ************************************************************************/
#include <mutex>
#include <stddef.h>
#include <vector>

#include "Record.h"

/*************************************************************************
 * Types
 ************************************************************************/
// Read position of an incremental reader. `generation` ties it to one session:
// clear() starts a new generation.
struct SeriesCursor {
  size_t   index      = 0;
  uint64_t generation = 0;
};

/*************************************************************************
 * Class
 ************************************************************************/
// Records of the current session. One writer (the sampler thread), any number
// of readers. Readers always get whole records in append order.
class SeriesStore {
public:
  void append(const Record& rec);

  // Copy of every record so far.
  std::vector<Record> snapshot() const;

  // Appends to `out` up to `max_count` records after `cursor` and advances it.
  // Returns true when the store was cleared since the cursor was taken: the copy
  // then restarts at the first record of the new session and whatever the
  // caller built from older records is stale.
  bool copySince(SeriesCursor& cursor, std::vector<Record>& out, size_t max_count = (size_t)-1) const;

  // Last `n` records, oldest first.
  std::vector<Record> tail(size_t n) const;

  // Copy of the newest record. Returns false when empty.
  bool latest(Record& out) const;

  size_t size() const;
  bool empty() const { return size() == 0; }

  void clear();

private:
  mutable std::mutex  records_mutex;
  std::vector<Record> records;
  uint64_t            generation = 0;
};

#endif // PDL_SERIES_STORE_H
