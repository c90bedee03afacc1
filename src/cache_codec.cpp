#include "cache_codec.hpp"
#include "cache.pb.h"

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/io/gzip_stream.h>
#include <boost/date_time/posix_time/posix_time.hpp>

#include <sstream>
#include <stdexcept>

namespace cartoposter {

namespace {

const boost::posix_time::ptime &epoch() {
  static const boost::posix_time::ptime e(boost::gregorian::date(1970, 1, 1));
  return e;
}

pb::feature::geometry_kind to_pb(geometry_kind k) {
  switch (k) {
  case geometry_kind::point:   return pb::feature::POINT;
  case geometry_kind::line:    return pb::feature::LINE;
  case geometry_kind::polygon: return pb::feature::POLYGON;
  }
  throw std::logic_error("Unhandled geometry kind");
}

geometry_kind from_pb(pb::feature::geometry_kind k) {
  switch (k) {
  case pb::feature::POINT:   return geometry_kind::point;
  case pb::feature::LINE:    return geometry_kind::line;
  case pb::feature::POLYGON: return geometry_kind::polygon;
  }
  throw std::runtime_error("Unknown geometry kind in cached dataset.");
}

} // anonymous namespace

std::string encode_coordinate(const resolved_coordinate &c) {
  pb::coordinate msg;
  msg.set_latitude(c.position.latitude);
  msg.set_longitude(c.position.longitude);
  if (!c.resolved_at.is_special()) {
    msg.set_resolved_at((c.resolved_at - epoch()).total_seconds());
  }
  return msg.SerializeAsString();
}

resolved_coordinate decode_coordinate(const std::string &payload) {
  pb::coordinate msg;
  if (!msg.ParseFromString(payload)) {
    throw std::runtime_error("Unable to read cached coordinate.");
  }

  resolved_coordinate c;
  c.position = coordinate(msg.latitude(), msg.longitude());
  c.source = coordinate_source::cache;
  if (msg.has_resolved_at()) {
    c.resolved_at = epoch() + boost::posix_time::seconds(long(msg.resolved_at()));
  }
  return c;
}

std::string encode_dataset(const geo_dataset &d, int compression_level) {
  pb::dataset msg;
  msg.set_latitude(d.center.latitude);
  msg.set_longitude(d.center.longitude);
  msg.set_radius(d.radius);

  for (const auto &entry : d.collections) {
    pb::collection *col = msg.add_collections();
    col->set_category(to_string(entry.first));
    for (const feature &f : entry.second) {
      pb::feature *pf = col->add_features();
      pf->set_id(f.id);
      pf->set_kind(to_pb(f.kind));
      for (const lonlat &p : f.points) {
        pf->add_coords(p.lon);
        pf->add_coords(p.lat);
      }
      for (const auto &tag : f.tags) {
        pf->add_keys(tag.first);
        pf->add_values(tag.second);
      }
    }
  }

  std::ostringstream buffer;
  {
    google::protobuf::io::OstreamOutputStream stream(&buffer);

    google::protobuf::io::GzipOutputStream::Options options;
    if (compression_level >= 0) {
      options.compression_level = compression_level;
    }
    options.format = google::protobuf::io::GzipOutputStream::ZLIB;
    google::protobuf::io::GzipOutputStream gz_stream(&stream, options);

    bool write_ok = msg.SerializeToZeroCopyStream(&gz_stream);
    if (!write_ok || !gz_stream.Close()) {
      throw std::runtime_error("Unable to write dataset to output stream.");
    }
  }
  return buffer.str();
}

dataset_ptr decode_dataset(const std::string &payload) {
  pb::dataset msg;
  {
    std::istringstream buffer(payload);
    google::protobuf::io::IstreamInputStream stream(&buffer);
    google::protobuf::io::GzipInputStream gz_stream(&stream);
    if (!msg.ParseFromZeroCopyStream(&gz_stream)) {
      throw std::runtime_error("Unable to read dataset from input stream.");
    }
  }

  std::shared_ptr<geo_dataset> d =
    std::make_shared<geo_dataset>(coordinate(msg.latitude(), msg.longitude()), msg.radius());

  for (const pb::collection &col : msg.collections()) {
    boost::optional<feature_category> category = category_from_string(col.category());
    if (!category) {
      throw std::runtime_error("Unknown category \"" + col.category() + "\" in cached dataset.");
    }

    feature_collection &features = d->collections[*category];
    for (const pb::feature &pf : col.features()) {
      if ((pf.coords_size() % 2 != 0) || (pf.keys_size() != pf.values_size())) {
        throw std::runtime_error("Malformed feature in cached dataset.");
      }

      feature f(pf.id(), from_pb(pf.kind()));
      for (int i = 0; i < pf.coords_size(); i += 2) {
        f.points.push_back(lonlat(pf.coords(i), pf.coords(i + 1)));
      }
      for (int i = 0; i < pf.keys_size(); ++i) {
        f.tags[pf.keys(i)] = pf.values(i);
      }
      features.push_back(std::move(f));
    }
  }

  return d;
}

} // namespace cartoposter
