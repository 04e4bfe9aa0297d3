#include "io/sink.hpp"

#include "runtime/error.hpp"

#include <cerrno>
#include <cstring>
#include <ostream>

namespace tomlenc {

void
ostream_sink::write(std::string_view s) {
  out_.write(s.data(), static_cast<std::streamsize>(s.size()));
  if (!out_)
    throw file_error{"Write to output stream failed"};
}

void
ostream_sink::flush() {
  out_.flush();
  if (!out_)
    throw file_error{"Flushing output stream failed"};
}

static std::FILE*
open_file(std::filesystem::path const& path) {
#ifndef WIN32
  return std::fopen(path.c_str(), "wb");
#else
  return _wfopen(path.c_str(), L"wb");
#endif
}

std::unique_ptr<file_sink>
file_sink::open(std::filesystem::path const& path) {
  if (std::FILE* f = open_file(path))
    return std::unique_ptr<file_sink>(new file_sink{f, path});
  else
    throw make_error<file_error>("Can't open {} for writing: {}",
                                 path.string(), std::strerror(errno));
}

file_sink::file_sink(std::FILE* f, std::filesystem::path path)
  : f_{f}
  , path_{std::move(path)}
{ }

file_sink::~file_sink() {
  if (f_)
    std::fclose(f_);
}

void
file_sink::write(std::string_view s) {
  if (!f_)
    throw make_error<file_error>("Write to closed file {}", path_.string());

  if (std::fwrite(s.data(), 1, s.size(), f_) != s.size())
    throw make_error<file_error>("Can't write to {}: {}",
                                 path_.string(), std::strerror(errno));
}

void
file_sink::flush() {
  if (f_ && std::fflush(f_) != 0)
    throw make_error<file_error>("Can't write to {}: {}",
                                 path_.string(), std::strerror(errno));
}

void
file_sink::close() {
  if (!f_)
    return;

  std::FILE* f = f_;
  f_ = nullptr;
  if (std::fclose(f) != 0)
    throw make_error<file_error>("Can't write to {}: {}",
                                 path_.string(), std::strerror(errno));
}

} // namespace tomlenc
