#ifndef CARTOPOSTER_EXPORTER_HPP
#define CARTOPOSTER_EXPORTER_HPP

#include "renderer.hpp"
#include "poster_spec.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem/path.hpp>
#include <string>

namespace cartoposter {

/* Descriptive fields written into the output file, where the format
 * has somewhere to put them.
 */
struct export_metadata {
  std::string title;
  std::string artist;
  std::string coordinates;
  std::string theme;
  std::string software;
  boost::posix_time::ptime created;
};

/* Writes finished posters into an output directory.
 *
 * Files are named <city>_<theme>_<YYYYmmdd_HHMMSS>.<ext>, with _1, _2 and
 * so on added when the name is already taken. Each file is written under
 * a temporary name first and hard-linked to its final name only once it
 * is complete, so nothing half-written is ever visible and two exporters
 * can never claim the same name.
 */
class exporter {
public:
  explicit exporter(const std::string &output_dir, int jpeg_quality = 95);

  // returns the path written. throws poster_error(export_error) if the
  // directory can't be created or the file can't be written.
  boost::filesystem::path save(const canvas &c, const poster_spec &spec,
                               const std::string &city, const export_metadata &meta) const;

  // the file name before any suffix is added.
  static std::string file_name(const std::string &city, const std::string &theme,
                               const boost::posix_time::ptime &created, output_format format);

  const boost::filesystem::path &output_dir() const { return m_output_dir; }

private:
  void write_file(const boost::filesystem::path &path, const canvas &c,
                  const poster_spec &spec, const export_metadata &meta) const;

  boost::filesystem::path m_output_dir;
  int m_jpeg_quality;
};

} // namespace cartoposter

#endif // CARTOPOSTER_EXPORTER_HPP
