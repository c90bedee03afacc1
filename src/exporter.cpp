#include "exporter.hpp"
#include "error.hpp"
#include "util.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/format.hpp>

#include <spdlog/spdlog.h>

#include <png.h>
#include <cstdio>
#include <jpeglib.h>

#ifdef HAVE_CAIRO
#include <mapnik/cairo/cairo_context.hpp>
#include <mapnik/cairo/cairo_renderer.hpp>
#include <cairo-pdf.h>
#include <cairo-svg.h>
#endif

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

#include <unistd.h>

namespace bfs = boost::filesystem;
namespace bpt = boost::posix_time;

// inches per meter, for the PNG physical size chunk.
#define METERS_PER_INCH (0.0254)

namespace cartoposter {

namespace {

// the fields every format with metadata gets, in the order written.
std::vector<std::pair<std::string, std::string> > metadata_fields(const export_metadata &meta) {
  std::vector<std::pair<std::string, std::string> > fields;
  fields.push_back(std::make_pair("Title", meta.title));
  fields.push_back(std::make_pair("Artist", meta.artist));
  fields.push_back(std::make_pair("Coordinates", meta.coordinates));
  fields.push_back(std::make_pair("Theme", meta.theme));
  fields.push_back(std::make_pair("Creation Time", bpt::to_iso_extended_string(meta.created)));
  fields.push_back(std::make_pair("Software", meta.software));
  return fields;
}

bool is_ascii(const std::string &s) {
  for (char c : s) {
    if (static_cast<unsigned char>(c) > 0x7f) { return false; }
  }
  return true;
}

// 8-bit RGB rows, dropping alpha.
std::vector<unsigned char> rgb_row(const mapnik::image_rgba8 &image, unsigned int y) {
  const mapnik::image_rgba8::pixel_type *row = image.get_row(y);
  std::vector<unsigned char> out(size_t(image.width()) * 3);
  for (unsigned int x = 0; x < image.width(); ++x) {
    const uint32_t p = row[x];
    out[3 * x] = p & 0xff;
    out[3 * x + 1] = (p >> 8) & 0xff;
    out[3 * x + 2] = (p >> 16) & 0xff;
  }
  return out;
}

void png_error_fn(png_structp, png_const_charp message) {
  throw std::runtime_error(std::string("PNG encoding failed: ") + message);
}

void png_warning_fn(png_structp, png_const_charp message) {
  spdlog::warn("libpng: {}", message);
}

void png_write_fn(png_structp png, png_bytep data, png_size_t length) {
  std::ostream *out = static_cast<std::ostream *>(png_get_io_ptr(png));
  out->write(reinterpret_cast<const char *>(data), length);
  if (!*out) {
    png_error(png, "unable to write to output file");
  }
}

void png_flush_fn(png_structp png) {
  static_cast<std::ostream *>(png_get_io_ptr(png))->flush();
}

struct png_write_guard {
  png_write_guard() : png(nullptr), info(nullptr) {}
  ~png_write_guard() {
    if (png != nullptr) {
      png_destroy_write_struct(&png, (info != nullptr) ? &info : nullptr);
    }
  }
  png_structp png;
  png_infop info;
};

void write_png(const bfs::path &path, const mapnik::image_rgba8 &image,
               unsigned int dpi, const export_metadata &meta) {
  std::ofstream out(path.string().c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("unable to open " + path.string() + " for writing");
  }

  png_write_guard guard;
  guard.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, &png_error_fn, &png_warning_fn);
  if (guard.png == nullptr) {
    throw std::runtime_error("unable to create PNG writer");
  }
  guard.info = png_create_info_struct(guard.png);
  if (guard.info == nullptr) {
    throw std::runtime_error("unable to create PNG info");
  }

  png_set_write_fn(guard.png, &out, &png_write_fn, &png_flush_fn);
  png_set_IHDR(guard.png, guard.info, image.width(), image.height(), 8, PNG_COLOR_TYPE_RGB,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);

  const png_uint_32 ppm = static_cast<png_uint_32>(std::lround(dpi / METERS_PER_INCH));
  png_set_pHYs(guard.png, guard.info, ppm, ppm, PNG_RESOLUTION_METER);

  // libpng wants mutable keys and values. tEXt is Latin-1 only, so
  // anything outside ASCII goes in an uncompressed iTXt chunk as UTF-8.
  std::vector<std::pair<std::string, std::string> > fields = metadata_fields(meta);
  std::vector<png_text> text(fields.size());
  char no_language[] = "";
  for (size_t i = 0; i < fields.size(); ++i) {
    std::memset(&text[i], 0, sizeof(png_text));
    text[i].key = &fields[i].first[0];
    text[i].text = &fields[i].second[0];
    if (is_ascii(fields[i].second)) {
      text[i].compression = PNG_TEXT_COMPRESSION_NONE;
      text[i].text_length = fields[i].second.size();
    } else {
      text[i].compression = PNG_ITXT_COMPRESSION_NONE;
      text[i].itxt_length = fields[i].second.size();
      text[i].lang = no_language;
      text[i].lang_key = no_language;
    }
  }
  png_set_text(guard.png, guard.info, text.data(), int(text.size()));

  png_write_info(guard.png, guard.info);
  for (unsigned int y = 0; y < image.height(); ++y) {
    std::vector<unsigned char> row = rgb_row(image, y);
    png_write_row(guard.png, row.data());
  }
  png_write_end(guard.png, guard.info);

  out.close();
  if (!out) {
    throw std::runtime_error("unable to finish writing " + path.string());
  }
}

void jpeg_error_exit(j_common_ptr cinfo) {
  char message[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, message);
  throw std::runtime_error(std::string("JPEG encoding failed: ") + message);
}

void jpeg_output_message(j_common_ptr cinfo) {
  char message[JMSG_LENGTH_MAX];
  (*cinfo->err->format_message)(cinfo, message);
  spdlog::warn("libjpeg: {}", message);
}

struct jpeg_compress_guard {
  jpeg_compress_guard() : file(nullptr) {
    cinfo.err = jpeg_std_error(&err);
    err.error_exit = &jpeg_error_exit;
    err.output_message = &jpeg_output_message;
    jpeg_create_compress(&cinfo);
  }
  ~jpeg_compress_guard() {
    jpeg_destroy_compress(&cinfo);
    if (file != nullptr) { std::fclose(file); }
  }
  jpeg_compress_struct cinfo;
  jpeg_error_mgr err;
  FILE *file;
};

void write_jpeg(const bfs::path &path, const mapnik::image_rgba8 &image, unsigned int dpi,
                int quality, const export_metadata &meta) {
  jpeg_compress_guard guard;
  guard.file = std::fopen(path.string().c_str(), "wb");
  if (guard.file == nullptr) {
    throw std::runtime_error("unable to open " + path.string() + " for writing: " + std::strerror(errno));
  }

  jpeg_compress_struct &cinfo = guard.cinfo;
  jpeg_stdio_dest(&cinfo, guard.file);
  cinfo.image_width = image.width();
  cinfo.image_height = image.height();
  cinfo.input_components = 3;
  cinfo.in_color_space = JCS_RGB;
  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  // dots per inch.
  cinfo.density_unit = 1;
  cinfo.X_density = static_cast<UINT16>(dpi);
  cinfo.Y_density = static_cast<UINT16>(dpi);

  jpeg_start_compress(&cinfo, TRUE);

  std::string comment;
  for (auto const &field : metadata_fields(meta)) {
    comment += field.first + ": " + field.second + "\n";
  }
  jpeg_write_marker(&cinfo, JPEG_COM, reinterpret_cast<const JOCTET *>(comment.data()),
                    static_cast<unsigned int>(comment.size()));

  for (unsigned int y = 0; y < image.height(); ++y) {
    std::vector<unsigned char> row = rgb_row(image, y);
    JSAMPROW rows[1] = { row.data() };
    jpeg_write_scanlines(&cinfo, rows, 1);
  }
  jpeg_finish_compress(&cinfo);

  const int closed = std::fclose(guard.file);
  guard.file = nullptr;
  if (closed != 0) {
    throw std::runtime_error("unable to finish writing " + path.string());
  }
}

#ifdef HAVE_CAIRO
void write_vector(const bfs::path &path, const mapnik::Map &map, output_format format,
                  const export_metadata &meta) {
  cairo_surface_t *raw = nullptr;
  if (format == output_format::pdf) {
    raw = cairo_pdf_surface_create(path.string().c_str(), map.width(), map.height());
  } else {
    raw = cairo_svg_surface_create(path.string().c_str(), map.width(), map.height());
  }
  mapnik::cairo_surface_ptr surface(raw, mapnik::cairo_surface_closer());
  if (cairo_surface_status(raw) != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error(cairo_status_to_string(cairo_surface_status(raw)));
  }

  // SVG has nowhere to put these.
  if (format == output_format::pdf) {
    cairo_pdf_surface_set_metadata(raw, CAIRO_PDF_METADATA_TITLE, meta.title.c_str());
    cairo_pdf_surface_set_metadata(raw, CAIRO_PDF_METADATA_AUTHOR, meta.artist.c_str());
    cairo_pdf_surface_set_metadata(raw, CAIRO_PDF_METADATA_SUBJECT, meta.coordinates.c_str());
    cairo_pdf_surface_set_metadata(raw, CAIRO_PDF_METADATA_KEYWORDS, meta.theme.c_str());
    cairo_pdf_surface_set_metadata(raw, CAIRO_PDF_METADATA_CREATOR, meta.software.c_str());
  }

  mapnik::cairo_ptr context = mapnik::create_context(surface);
  mapnik::cairo_renderer<mapnik::cairo_ptr> ren(map, context, 1.0);
  ren.apply();
  cairo_surface_finish(raw);

  if (cairo_surface_status(raw) != CAIRO_STATUS_SUCCESS) {
    throw std::runtime_error(cairo_status_to_string(cairo_surface_status(raw)));
  }
}
#else
void write_vector(const bfs::path &, const mapnik::Map &, output_format format,
                  const export_metadata &) {
  throw std::runtime_error(to_string(format) + " output needs Cairo, which this build does not have");
}
#endif

/* A file under a temporary name, removed when it goes out of scope.
 */
struct temp_file {
  explicit temp_file(const bfs::path &dir)
    : path(dir / bfs::unique_path(".cartoposter-%%%%-%%%%-%%%%.tmp")) {}
  ~temp_file() {
    boost::system::error_code ec;
    bfs::remove(path, ec);
    if (ec) {
      spdlog::warn("Unable to remove temporary file {}: {}", path.string(), ec.message());
    }
  }
  bfs::path path;
};

} // anonymous namespace

exporter::exporter(const std::string &output_dir, int jpeg_quality)
  : m_output_dir(output_dir), m_jpeg_quality(jpeg_quality) {
  if (jpeg_quality < 1 || jpeg_quality > 100) {
    throw std::runtime_error("JPEG quality must be between 1 and 100.");
  }
}

std::string exporter::file_name(const std::string &city, const std::string &theme,
                                const bpt::ptime &created, output_format format) {
  const boost::gregorian::date d = created.date();
  const bpt::time_duration t = created.time_of_day();
  return (boost::format("%1%_%2%_%3$04d%4$02d%5$02d_%6$02d%7$02d%8$02d.%9%")
          % util::slugify(city) % util::slugify(theme)
          % int(d.year()) % int(d.month()) % int(d.day())
          % t.hours() % t.minutes() % t.seconds()
          % extension_for(format)).str();
}

void exporter::write_file(const bfs::path &path, const canvas &c, const poster_spec &spec,
                          const export_metadata &meta) const {
  switch (spec.format) {
  case output_format::png:
  case output_format::jpeg:
    if (!c.image) {
      throw std::runtime_error("no raster image was rendered for " + to_string(spec.format) + " output");
    }
    if (spec.format == output_format::png) {
      write_png(path, *c.image, spec.dpi, meta);
    } else {
      write_jpeg(path, *c.image, spec.dpi, m_jpeg_quality, meta);
    }
    break;

  case output_format::svg:
  case output_format::pdf:
    if (!c.map) {
      throw std::runtime_error("no map was prepared for " + to_string(spec.format) + " output");
    }
    write_vector(path, *c.map, spec.format, meta);
    break;
  }
}

bfs::path exporter::save(const canvas &c, const poster_spec &spec,
                         const std::string &city, const export_metadata &meta) const {
  try {
    bfs::create_directories(m_output_dir);
  } catch (const bfs::filesystem_error &e) {
    throw poster_error(error_kind::export_error,
                       "Unable to create output directory " + m_output_dir.string() + ": " + e.what());
  }

  const std::string name = file_name(city, meta.theme, meta.created, spec.format);
  const std::string stem = bfs::path(name).stem().string();
  const std::string ext = bfs::path(name).extension().string();

  try {
    temp_file tmp(m_output_dir);
    write_file(tmp.path, c, spec, meta);

    // claim the first free name. link() fails rather than replacing an
    // existing file, so concurrent exporters can't collide.
    for (int n = 0; ; ++n) {
      const bfs::path target = m_output_dir /
        ((n == 0) ? name : (boost::format("%1%_%2%%3%") % stem % n % ext).str());

      if (::link(tmp.path.string().c_str(), target.string().c_str()) == 0) {
        spdlog::info("Saved poster to {}", target.string());
        return target;
      }
      if (errno != EEXIST) {
        throw std::runtime_error("unable to create " + target.string() + ": " + std::strerror(errno));
      }
    }

  } catch (const poster_error &) {
    throw;

  } catch (const std::exception &e) {
    throw poster_error(error_kind::export_error, e.what());
  }
}

} // namespace cartoposter
