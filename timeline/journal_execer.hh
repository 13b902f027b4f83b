//
// Created by jason on 2022/10/16.
//

#pragma once

#include <memory>
#include <seastar/core/file.hh>
#include <seastar/core/semaphore.hh>

#include "timeline/execer.hh"
#include "util/types.hh"

namespace vigil::timeline {

// Appends every statement as one line to a journal file owned by this
// agent run: stmt<TAB>arg<TAB>arg... A line is on disk before exec()
// resolves.
class journal_execer final : public execer {
 public:
  // creates dir if needed and a new journal file named after the start
  // time of the agent
  static future<std::unique_ptr<journal_execer>> open(std::string dir);

  journal_execer(std::string path, seastar::file f)
    : _path(std::move(path)), _file(std::move(f)) {}
  DISALLOW_COPY_MOVE_AND_ASSIGN(journal_execer);

  future<> exec(std::string stmt, std::vector<argument> args) override;
  future<> close() override;

  const std::string& path() const noexcept { return _path; }
  uint64_t bytes() const noexcept { return _bytes; }

  // the journal line of a statement, without the trailing newline
  static std::string format_line(
      std::string_view stmt, const std::vector<argument>& args);

 private:
  std::string _path;
  seastar::file _file;
  seastar::semaphore _lock{1};
  bool _closed = false;
  // the file is always written in whole dma blocks starting from here,
  // _tail holds the bytes of the last partial block
  uint64_t _aligned_pos = 0;
  std::string _tail;
  uint64_t _bytes = 0;
};

}  // namespace vigil::timeline
