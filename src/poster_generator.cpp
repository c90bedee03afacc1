#include "poster_generator.hpp"
#include "geographic_context.hpp"
#include "layer_builder.hpp"
#include "typography.hpp"
#include "fetch/http.hpp"
#include "fetch/nominatim.hpp"
#include "fetch/overpass.hpp"
#include "config.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/format.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#define ATTRIBUTION "\xC2\xA9 OpenStreetMap contributors"

namespace bfs = boost::filesystem;

namespace cartoposter {

namespace {

void notify(const progress_callback &progress, progress_stage stage, const std::string &note) {
  spdlog::debug("{}: {}", to_string(stage), note);
  if (!progress) {
    return;
  }
  try {
    progress(stage, note);

  } catch (const std::exception &e) {
    spdlog::warn("Progress callback failed at {}: {}", to_string(stage), e.what());
  }
}

std::chrono::steady_clock::duration seconds(double s) {
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(
    std::chrono::duration<double>(s));
}

boost::posix_time::ptime local_now() {
  return boost::posix_time::second_clock::local_time();
}

} // anonymous namespace

std::string to_string(progress_stage stage) {
  switch (stage) {
  case progress_stage::fetch_start:     return "fetch_start";
  case progress_stage::data_downloaded: return "data_downloaded";
  case progress_stage::processing:      return "processing";
  case progress_stage::rendering:       return "rendering";
  case progress_stage::saving:          return "saving";
  case progress_stage::done:            return "done";
  case progress_stage::failed:          return "failed";
  }
  return "unknown";
}

generation_result::generation_result(const bfs::path &p, const std::vector<warning> &w)
  : outcome(p), warnings(w) {
}

generation_result::generation_result(const failure &f, const std::vector<warning> &w)
  : outcome(f), warnings(w) {
}

generator_services::generator_services()
  : now(&local_now), artist("cartoposter"), default_dpi(300) {
}

poster_generator::poster_generator(const generator_services &services)
  : m_services(services) {
  if (!services.resolver || !services.fetcher || !services.themes || !services.painter ||
      !services.post || !services.output || !services.now) {
    throw std::invalid_argument("poster_generator needs every service set");
  }
}

bfs::path poster_generator::run(const generation_request &request, const progress_callback &progress,
                                progress_stage &stage, std::vector<warning> &warnings) const {
  const validated_request v = validate(request, m_services.default_dpi);
  const std::string city = v.location.clean_city();

  stage = progress_stage::fetch_start;
  notify(progress, stage, (boost::format("Finding %1%") % v.location).str());
  const resolved_coordinate position = m_services.resolver->resolve(v.location);

  fetch_outcome data = m_services.fetcher->fetch(position.position, v.radius);
  warnings.insert(warnings.end(), data.warnings.begin(), data.warnings.end());

  stage = progress_stage::data_downloaded;
  notify(progress, stage, (boost::format("%1% features around %2%")
                           % data.dataset->size() % format_coordinate(position.position)).str());

  stage = progress_stage::processing;
  notify(progress, stage, "Styling layers with theme " + v.theme);
  const theme t = m_services.themes->load(v.theme);
  const geographic_context context = detect_context(*data.dataset, v.season_type);
  spdlog::info("Geographic context: {}, season {}", to_string(context.terrain_type),
               to_string(context.season_type));
  const styled_map styles = theme_engine::resolve(t, build_layers(*data.dataset), context, v.overrides);

  // the theme can suggest a font, texture or effect when the request
  // has none.
  poster_spec spec = v.spec;
  if (spec.font.empty()) {
    spec.font = t.font ? *t.font : poster_spec().font;
  }
  if (!spec.texture && t.texture) {
    spec.texture = *t.texture;
  }
  // the engine only accepts known effect names.
  if (!spec.effect && t.effect) {
    spec.effect = effect_from_string(*t.effect);
  }

  stage = progress_stage::rendering;
  notify(progress, stage, (boost::format("Drawing %1%x%2% in poster") % spec.width % spec.height).str());
  poster_text text;
  text.city = city;
  text.country = v.country_label;
  text.center = position.position;
  text.attribution = ATTRIBUTION;
  canvas c = m_services.painter->render(styles, spec, text, v.radius, warnings);
  m_services.post->process(c, spec, warnings);

  stage = progress_stage::saving;
  notify(progress, stage, "Writing " + to_string(spec.format));
  export_metadata meta;
  meta.title = v.country_label.empty() ? city : city + ", " + v.country_label;
  meta.artist = m_services.artist;
  meta.coordinates = format_coordinate(position.position);
  meta.theme = t.id;
  meta.software = "cartoposter " VERSION;
  meta.created = m_services.now();
  return m_services.output->save(c, spec, city, meta);
}

generation_result poster_generator::generate(const generation_request &request,
                                             const progress_callback &progress) const {
  std::vector<warning> warnings;
  progress_stage stage = progress_stage::fetch_start;
  failure f;

  try {
    const bfs::path path = run(request, progress, stage, warnings);
    notify(progress, progress_stage::done, path.string());
    return generation_result(path, warnings);

  } catch (const poster_error &e) {
    f = e.as_failure();

  } catch (const std::exception &e) {
    // components report what they know as poster_error, so anything
    // else is unexpected.
    f.kind = error_kind::internal_error;
    f.message = (boost::format("Unexpected failure during %1%: %2%") % to_string(stage) % e.what()).str();
  }

  spdlog::error("Poster generation failed: {}", f);
  notify(progress, progress_stage::failed, f.message);
  return generation_result(f, warnings);
}

std::unique_ptr<poster_generator> make_generator(const settings &s, bool no_cache) {
  // the fetcher may make clients from several threads at once.
  fetch::http_global_init();

  std::shared_ptr<cache_store> cache;
  if (no_cache) {
    cache = std::make_shared<memory_cache>();
  } else {
    cache = std::make_shared<sqlite_cache>(s.cache_path);
  }

  resolver_options options;
  options.max_attempts = s.geocode_attempts;
  options.backoff_base = seconds(s.backoff_base);
  options.rate_limit_penalty = seconds(s.rate_limit_penalty);

  generator_services services;
  services.resolver = std::make_shared<location_resolver>(
    std::make_shared<fetch::nominatim>(s.nominatim_url, s.user_agent, s.http_timeout),
    cache, shared_geocode_limiter(seconds(s.rate_limit_interval)), real_clock_source(), options);
  services.fetcher = std::make_shared<data_fetcher>(
    std::make_shared<fetch::overpass>(s.overpass_url, s.user_agent, s.http_timeout),
    cache, s.parallel_fetch);
  services.themes = std::make_shared<theme_engine>(s.theme_dir);
  services.painter = std::make_shared<renderer>(s.font_dir);
  services.post = std::make_shared<post_processor>(s.texture_dir);
  services.post->load(s.post_process);
  services.output = std::make_shared<exporter>(s.output_dir, s.jpeg_quality);
  services.artist = s.artist;
  services.default_dpi = s.dpi;

  return std::unique_ptr<poster_generator>(new poster_generator(services));
}

} // namespace cartoposter
