#ifndef TOMLENC_IO_SINK_HPP
#define TOMLENC_IO_SINK_HPP

#include <cstdio>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <string_view>

namespace tomlenc {

// Where rendered text goes. Failures are reported as file_error.
class text_sink {
public:
  virtual
  ~text_sink() = default;

  virtual void
  write(std::string_view) = 0;

  virtual void
  flush() { }
};

class ostream_sink final : public text_sink {
public:
  explicit
  ostream_sink(std::ostream& out) : out_{out} { }

  void
  write(std::string_view) override;

  void
  flush() override;

private:
  std::ostream& out_;
};

class string_sink final : public text_sink {
public:
  void
  write(std::string_view s) override { data_ += s; }

  std::string const&
  get_string() const { return data_; }

private:
  std::string data_;
};

class file_sink final : public text_sink {
public:
  // Opens the file for binary writing, truncating it. Throws file_error if
  // it can't be opened.
  static std::unique_ptr<file_sink>
  open(std::filesystem::path const&);

  file_sink(file_sink const&) = delete;

  file_sink&
  operator = (file_sink const&) = delete;

  ~file_sink() override;

  void
  write(std::string_view) override;

  void
  flush() override;

  // Flush and close, reporting any error. The destructor closes silently.
  void
  close();

  std::filesystem::path const&
  path() const { return path_; }

private:
  std::FILE*            f_;
  std::filesystem::path path_;

  file_sink(std::FILE*, std::filesystem::path);
};

} // namespace tomlenc

#endif
