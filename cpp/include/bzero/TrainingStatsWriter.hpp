#pragma once

#include "bzero/BasicTypes.hpp"

#include <boost/filesystem.hpp>

#include <fstream>
#include <vector>

namespace bzero {

struct TrainingStatsRow {
  round_t round;
  float loss;
  float value_loss;
  float policy_loss;
  int buffer_size;
};

/*
 * Appends one CSV row per training step:
 *
 * round,loss,value_loss,policy_loss,buffer_size
 *
 * The parent directory and the header line are created lazily on the first append(). Each row is
 * flushed immediately. An empty path keeps the rows in memory only.
 *
 * Not thread-safe; TrainingCoordinator calls append() under its exclusive lock.
 */
class TrainingStatsWriter {
 public:
  explicit TrainingStatsWriter(const boost::filesystem::path& path) : path_(path) {}

  void append(const TrainingStatsRow& row);

  const std::vector<TrainingStatsRow>& rows() const { return rows_; }
  const boost::filesystem::path& path() const { return path_; }

 private:
  void open();

  const boost::filesystem::path path_;
  std::ofstream file_;
  std::vector<TrainingStatsRow> rows_;
};

}  // namespace bzero
