#include "io/write.hpp"

#include "encoder/cycle_guard.hpp"
#include "encoder/encoder.hpp"
#include "io/sink.hpp"
#include "runtime/error.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <memory>

namespace tomlenc {

static bool
ends_with_blank_line(std::string const& s) {
  return s.size() >= 2 && s.compare(s.size() - 2, 2, "\n\n") == 0;
}

static std::string
render_with(table const& root, encoder const& enc) {
  format_context ctx{enc};

  section_dump top = enc.dump_sections(ctx, root, "");
  std::string result = std::move(top.text);

  layer_history history{root};
  std::shared_ptr<table> sections = std::move(top.residual);
  std::size_t layer = 1;
  while (!sections->empty()) {
    history.enter_layer(*sections);

    if (enc.config().verbose)
      fmt::print(stderr, "toml: layer {}: {} section(s)\n", layer, sections->size());

    std::shared_ptr<table> next = enc.make_table();
    for (auto const& [key, section] : *sections) {
      section_dump d = enc.dump_sections(ctx, *section.as_table(), key);

      if (!d.text.empty() || d.residual->empty()) {
        if (!result.empty() && !ends_with_blank_line(result))
          result += '\n';

        result += "[" + key + "]\n" + d.text;
      }

      for (auto const& [sub_key, sub] : *d.residual)
        next->insert_or_assign(key + '.' + sub_key, sub);
    }

    sections = std::move(next);
    ++layer;
  }

  return result;
}

std::string
render(table const& root, encoder const* enc) {
  if (enc)
    return render_with(root, *enc);

  encoder default_encoder{encoder_config{
    .make_table = [&] { return root.make_empty(); }
  }};
  return render_with(root, default_encoder);
}

static void
write_to_sink(text_sink& sink, std::string const& text) {
  sink.write(text);
  sink.flush();
}

static void
write_to_file(std::filesystem::path const& path, std::string const& text) {
  std::unique_ptr<file_sink> sink = file_sink::open(path);
  sink->write(text);
  sink->close();
}

namespace {
  struct destination_writer {
    std::string const& text;

    void
    operator () (std::string const& path) const {
      write_to_file(path, text);
    }

    void
    operator () (std::filesystem::path const& path) const {
      write_to_file(path, text);
    }

    void
    operator () (std::ostream* out) const {
      ostream_sink sink{*out};
      write_to_sink(sink, text);
    }

    void
    operator () (text_sink* sink) const {
      write_to_sink(*sink, text);
    }
  };
}

void
write(table const& root, destination const& out, encoder const* enc) {
  if (auto const* s = std::get_if<std::ostream*>(&out); s && !*s)
    throw configuration_error{"Null output stream"};
  if (auto const* s = std::get_if<text_sink*>(&out); s && !*s)
    throw configuration_error{"Null output sink"};

  std::string text = render(root, enc);
  std::visit(destination_writer{text}, out);
}

} // namespace tomlenc
