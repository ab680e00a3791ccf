/************************************************************************
 * @file SeriesStore.cpp
 * @brief Session record buffer shared by sampler, views and export
 ************************************************************************/

#include "SeriesStore.h"
#include "Log.h"

static const char* TAG_STORE = "STORE";

void SeriesStore::append(const Record& rec) {
  std::lock_guard<std::mutex> lock(records_mutex);
  records.push_back(rec);
}

std::vector<Record> SeriesStore::snapshot() const {
  std::lock_guard<std::mutex> lock(records_mutex);
  return records;
}

bool SeriesStore::copySince(SeriesCursor& cursor, std::vector<Record>& out, size_t max_count) const {
  std::lock_guard<std::mutex> lock(records_mutex);
  const bool restarted = (cursor.generation != generation);
  if (restarted) {
    cursor.generation = generation;
    cursor.index = 0;
  }

  const size_t n = records.size();
  size_t avail = (cursor.index < n) ? n - cursor.index : 0;
  if (avail > max_count) avail = max_count;
  out.insert(out.end(), records.begin() + cursor.index, records.begin() + cursor.index + avail);
  cursor.index += avail;
  return restarted;
}

std::vector<Record> SeriesStore::tail(size_t n) const {
  std::lock_guard<std::mutex> lock(records_mutex);
  const size_t start = (records.size() > n) ? records.size() - n : 0;
  return std::vector<Record>(records.begin() + start, records.end());
}

bool SeriesStore::latest(Record& out) const {
  std::lock_guard<std::mutex> lock(records_mutex);
  if (records.empty()) return false;
  out = records.back();
  return true;
}

size_t SeriesStore::size() const {
  std::lock_guard<std::mutex> lock(records_mutex);
  return records.size();
}

void SeriesStore::clear() {
  size_t dropped;
  {
    std::lock_guard<std::mutex> lock(records_mutex);
    dropped = records.size();
    records.clear();
    generation++;
  }
  pdlLog(TAG_STORE)->info("session cleared ({} records dropped)", dropped);
}
