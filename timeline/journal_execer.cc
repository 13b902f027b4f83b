//
// Created by jason on 2022/10/16.
//

#include "journal_execer.hh"

#include <filesystem>
#include <seastar/core/align.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/seastar.hh>
#include <seastar/core/temporary_buffer.hh>

#include "protocol/status.hh"
#include "timeline/logger.hh"
#include "util/error.hh"

namespace vigil::timeline {

namespace {

void append_escaped(std::string& line, std::string_view s) {
  for (char c : s) {
    switch (c) {
      case '\t':
        line.append("\\t");
        break;
      case '\n':
        line.append("\\n");
        break;
      case '\\':
        line.append("\\\\");
        break;
      default:
        line.push_back(c);
    }
  }
}

}  // namespace

future<std::unique_ptr<journal_execer>> journal_execer::open(std::string dir) {
  co_await recursive_touch_directory(dir);
  auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                 protocol::clock::now().time_since_epoch())
                 .count();
  auto path = std::filesystem::path(dir)
                  .append(fmt::format("timeline-{:020d}.journal", now))
                  .string();
  auto f = co_await open_file_dma(
      path, open_flags::create | open_flags::exclusive | open_flags::rw);
  co_await sync_directory(dir);
  l.info("journal_execer::open: {}", path);
  co_return std::make_unique<journal_execer>(std::move(path), std::move(f));
}

future<> journal_execer::exec(std::string stmt, std::vector<argument> args) {
  auto units = co_await get_units(_lock, 1);
  if (_closed) [[unlikely]] {
    co_await coroutine::return_exception(util::closed_error("journal"));
  }
  auto line = format_line(stmt, args);
  line.push_back('\n');

  auto alignment = _file.disk_write_dma_alignment();
  auto data = _tail + line;
  auto padded = align_up<uint64_t>(data.size(), alignment);
  auto buf =
      temporary_buffer<char>::aligned(_file.memory_dma_alignment(), padded);
  auto end = std::copy(data.begin(), data.end(), buf.get_write());
  std::fill(end, buf.get_write() + padded, 0);
  size_t written = 0;
  try {
    written = co_await _file.dma_write(_aligned_pos, buf.get(), padded);
  } catch (const std::exception& ex) {
    throw util::storage_error(
        fmt::format("append to {} failed: {}", _path, ex.what()));
  }
  if (written < padded) {
    l.error(
        "journal_execer::exec: short write to {}, expect:{}, actual:{}",
        _path,
        padded,
        written);
    co_await coroutine::return_exception(util::short_write_error(_path));
  }
  auto full = align_down<uint64_t>(data.size(), alignment);
  _aligned_pos += full;
  _tail = data.substr(full);
  _bytes = _aligned_pos + _tail.size();
  // drop the padding of the last block
  co_await _file.truncate(_bytes);
  co_await _file.flush();
}

future<> journal_execer::close() {
  auto units = co_await get_units(_lock, 1);
  if (_closed) {
    co_return;
  }
  _closed = true;
  co_await _file.close();
}

std::string journal_execer::format_line(
    std::string_view stmt, const std::vector<argument>& args) {
  std::string line;
  append_escaped(line, stmt);
  for (const auto& arg : args) {
    line.push_back('\t');
    if (const auto* n = std::get_if<int64_t>(&arg)) {
      line.append(std::to_string(*n));
    } else {
      append_escaped(line, std::get<std::string>(arg));
    }
  }
  return line;
}

}  // namespace vigil::timeline
