#include "bzero/TrainingStatsWriter.hpp"

#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <format>

namespace bzero {

void TrainingStatsWriter::append(const TrainingStatsRow& row) {
  rows_.push_back(row);
  if (path_.empty()) return;

  if (!file_.is_open()) {
    open();
  }
  file_ << std::format("{},{},{},{},{}\n", row.round, row.loss, row.value_loss, row.policy_loss,
                       row.buffer_size);
  file_.flush();
  if (!file_) {
    throw util::Exception("Failed to write training stats to {}", path_.string());
  }
}

void TrainingStatsWriter::open() {
  namespace fs = boost::filesystem;

  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path());
  }
  bool write_header = !fs::exists(path_) || fs::file_size(path_) == 0;

  file_.open(path_.string(), std::ios::app);
  if (!file_.is_open()) {
    throw util::Exception("Unable to open training stats file: {}", path_.string());
  }
  if (write_header) {
    file_ << "round,loss,value_loss,policy_loss,buffer_size\n";
  }
  LOG_INFO("Writing training stats to {}", path_.string());
}

}  // namespace bzero
