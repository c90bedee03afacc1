#include "post_processor.hpp"
#include "post_process/stage.hpp"
#include "post_process/texture_overlay.hpp"
#include "post_process/artistic_effect.hpp"
#include "post_process/color_enhancer.hpp"

#include <boost/format.hpp>
#include <spdlog/spdlog.h>

#include <map>

namespace pt = boost::property_tree;

namespace cartoposter {

namespace {

const std::string TEXTURE_STAGE = "texture";

typedef post_process::stage_ptr (*stage_builder)(pt::ptree const& config);

// every stage a configuration block may name.
const std::map<std::string, stage_builder> &stage_builders() {
  static const std::map<std::string, stage_builder> builders = {
    { TEXTURE_STAGE, post_process::create_texture_overlay },
    { "watercolor", post_process::create_watercolor },
    { "pencil_sketch", post_process::create_pencil_sketch },
    { "oil_painting", post_process::create_oil_painting },
    { "vintage", post_process::create_vintage },
    { "intelligent_palette", post_process::create_intelligent_palette },
    { "geographic_colors", post_process::create_geographic_colors },
    { "seasonal_spring", post_process::create_seasonal_spring },
    { "seasonal_summer", post_process::create_seasonal_summer },
    { "seasonal_autumn", post_process::create_seasonal_autumn },
    { "seasonal_winter", post_process::create_seasonal_winter },
  };
  return builders;
}

post_process::stage_ptr build_stage(const std::string &name, pt::ptree const& config) {
  auto itr = stage_builders().find(name);
  if (itr == stage_builders().end()) {
    throw std::runtime_error("Unrecognized post-processing stage: " + name);
  }
  return itr->second(config);
}

void warn(std::vector<warning> &warnings, const std::string &message) {
  warning w;
  w.kind = error_kind::asset_missing;
  w.message = message;
  spdlog::warn("{}", message);
  warnings.push_back(w);
}

} // anonymous namespace

class post_processor::pimpl {
public:
  pimpl(const std::string &texture_dir);
  void load(pt::ptree const& config);
  void process(canvas &c, const poster_spec &spec, std::vector<warning> &warnings) const;

  std::string m_texture_dir;

private:
  pt::ptree const& parameters(const std::string &stage) const;
  post_process::stage_ptr texture_stage(const std::string &name, std::vector<warning> &warnings) const;

  std::map<std::string, pt::ptree> m_parameters;
};

post_processor::pimpl::pimpl(const std::string &texture_dir)
  : m_texture_dir(texture_dir), m_parameters() {
}

// Parse config tree and check each stage can be built from it
void post_processor::pimpl::load(pt::ptree const& config) {
  for (auto const& child : config) {
    const std::string &name = child.first;
    if (stage_builders().count(name) == 0) {
      throw std::runtime_error("Unrecognized post-processing stage: " + name);
    }

    if (name == TEXTURE_STAGE) {
      const double intensity = child.second.get<double>("intensity", 0.3);
      if (intensity < 0.0 || intensity > 1.0) {
        throw std::runtime_error("Texture intensity must be between 0 and 1.");
      }
      boost::optional<std::string> dir = child.second.get_optional<std::string>("directory");
      if (dir) { m_texture_dir = *dir; }
    } else {
      // building the stage is enough to validate its parameters.
      build_stage(name, child.second);
    }

    m_parameters[name] = child.second;
  }
}

pt::ptree const& post_processor::pimpl::parameters(const std::string &stage) const {
  static const pt::ptree empty;
  auto itr = m_parameters.find(stage);
  return (itr == m_parameters.end()) ? empty : itr->second;
}

post_process::stage_ptr post_processor::pimpl::texture_stage(const std::string &name,
                                                              std::vector<warning> &warnings) const {
  boost::optional<boost::filesystem::path> path = post_process::find_texture(m_texture_dir, name);
  if (!path) {
    warn(warnings, (boost::format("Texture \"%1%\" not found in %2%; skipping texture overlay.")
                    % name % m_texture_dir).str());
    return post_process::stage_ptr();
  }

  pt::ptree config = parameters(TEXTURE_STAGE);
  config.put("path", path->string());
  try {
    return build_stage(TEXTURE_STAGE, config);

  } catch (const std::exception &e) {
    warn(warnings, (boost::format("Texture \"%1%\" could not be read: %2%; skipping texture overlay.")
                    % name % e.what()).str());
  }
  return post_process::stage_ptr();
}

void post_processor::pimpl::process(canvas &c, const poster_spec &spec,
                                    std::vector<warning> &warnings) const {
  if (!spec.texture && !spec.effect && !spec.enhancement) {
    return;
  }

  if (!c.is_raster()) {
    warn(warnings, (boost::format("Post-processing is not available for %1% output; skipping it.")
                    % to_string(spec.format)).str());
    return;
  }

  std::vector<std::pair<std::string, post_process::stage_ptr> > stages;
  if (spec.texture) {
    post_process::stage_ptr p = texture_stage(*spec.texture, warnings);
    if (p) { stages.push_back(std::make_pair(TEXTURE_STAGE + " " + *spec.texture, p)); }
  }
  if (spec.effect) {
    const std::string name = to_string(*spec.effect);
    stages.push_back(std::make_pair(name, build_stage(name, parameters(name))));
  }
  if (spec.enhancement) {
    const std::string name = to_string(*spec.enhancement);
    stages.push_back(std::make_pair(name, build_stage(name, parameters(name))));
  }

  for (auto const& s : stages) {
    spdlog::info("Applying {}", s.first);
    s.second->process(*c.image);
  }
}

post_processor::post_processor(const std::string &texture_dir)
  : m_impl(new pimpl(texture_dir)) {}

post_processor::~post_processor() {}

void post_processor::load(pt::ptree const& config) {
  std::unique_ptr<pimpl> impl(new pimpl(m_impl->m_texture_dir));
  impl->load(config);
  // if we got here without throwing an exception, then
  // we should be OK to use this new configuration.
  m_impl.swap(impl);
}

void post_processor::process(canvas &c, const poster_spec &spec, std::vector<warning> &warnings) const {
  m_impl->process(c, spec, warnings);
}

} // namespace cartoposter
