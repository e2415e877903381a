#include "memoryos/memory/vector_index.hpp"

#include "memoryos/common/fs.hpp"
#include "memoryos/common/hash.hpp"
#include "memoryos/memory/embedder_local.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace memoryos::memory {

namespace {

constexpr char kVecMagic[8] = {'M', 'O', 'S', 'V', 'E', 'C', '0', '1'};
constexpr char kMapMagic[8] = {'M', 'O', 'S', 'M', 'A', 'P', '0', '1'};
constexpr std::uint32_t kFormatVersion = 1;
constexpr std::size_t kDigestSize = 32;

struct FileHeader {
  std::uint32_t version = 0;
  std::uint32_t modality = 0;
  std::uint32_t metric = 0;
  std::uint64_t dimensions = 0;
  std::uint64_t slot_count = 0;
};

template <typename T> void put(std::string &out, const T value) {
  char raw[sizeof(T)];
  std::memcpy(raw, &value, sizeof(T));
  out.append(raw, sizeof(T));
}

void put_header(std::string &out, const char (&magic)[8], const FileHeader &header) {
  out.append(magic, sizeof(magic));
  put(out, header.version);
  put(out, header.modality);
  put(out, header.metric);
  put(out, header.dimensions);
  put(out, header.slot_count);
}

void append_digest(std::string &out) {
  const auto digest = common::sha256(out);
  out.append(reinterpret_cast<const char *>(digest.data()), digest.size());
}

class Reader {
public:
  explicit Reader(std::string_view data) : data_(data) {}

  template <typename T> bool get(T &value) {
    if (pos_ + sizeof(T) > data_.size()) {
      return false;
    }
    std::memcpy(&value, data_.data() + pos_, sizeof(T));
    pos_ += sizeof(T);
    return true;
  }

  bool get_bytes(std::size_t count, std::string_view &out) {
    if (pos_ + count > data_.size()) {
      return false;
    }
    out = data_.substr(pos_, count);
    pos_ += count;
    return true;
  }

  [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }

private:
  std::string_view data_;
  std::size_t pos_ = 0;
};

// Splits off and checks the trailing digest; returns the covered body.
std::optional<std::string_view> verified_body(const std::string &file) {
  if (file.size() < kDigestSize) {
    return std::nullopt;
  }
  const std::string_view body(file.data(), file.size() - kDigestSize);
  const auto digest = common::sha256(body);
  if (std::memcmp(digest.data(), file.data() + body.size(), kDigestSize) != 0) {
    return std::nullopt;
  }
  return body;
}

bool read_header(Reader &reader, const char (&magic)[8], FileHeader &header) {
  std::string_view found;
  return reader.get_bytes(sizeof(magic), found) &&
         std::memcmp(found.data(), magic, sizeof(magic)) == 0 && reader.get(header.version) &&
         reader.get(header.modality) && reader.get(header.metric) &&
         reader.get(header.dimensions) && reader.get(header.slot_count);
}

common::Status corrupt(const std::string &message) {
  return common::Status::error(common::ErrorCode::CorruptIndex, message);
}

} // namespace

std::string to_string(const Metric metric) {
  return metric == Metric::InnerProduct ? "ip" : "l2";
}

VectorIndex::VectorIndex(const Modality modality, const std::size_t dimensions, const Metric metric)
    : modality_(modality), dimensions_(dimensions), metric_(metric) {}

common::Result<std::size_t> VectorIndex::add(const std::string &id, std::vector<float> vector) {
  if (vector.size() != dimensions_) {
    return common::Result<std::size_t>::failure(
        common::ErrorCode::DimensionMismatch,
        to_string(modality_) + " index expects " + std::to_string(dimensions_) +
            " dimensions, got " + std::to_string(vector.size()));
  }
  if (metric_ == Metric::InnerProduct) {
    l2_normalize(vector);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (id_to_slot_.contains(id)) {
    return common::Result<std::size_t>::failure(common::ErrorCode::InvalidArgument,
                                                "id already indexed: " + id);
  }
  const std::size_t slot = slot_ids_.size();
  data_.insert(data_.end(), vector.begin(), vector.end());
  slot_ids_.push_back(id);
  live_.push_back(true);
  id_to_slot_.emplace(id, slot);
  ++live_count_;
  return common::Result<std::size_t>::success(slot);
}

common::Status VectorIndex::remove(const std::size_t slot) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slot >= slot_ids_.size()) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "slot " + std::to_string(slot) + " out of range");
  }
  if (!live_[slot]) {
    return common::Status::success();
  }
  live_[slot] = false;
  id_to_slot_.erase(slot_ids_[slot]);
  std::fill_n(data_.begin() + static_cast<std::ptrdiff_t>(slot * dimensions_), dimensions_, 0.0F);
  --live_count_;
  return common::Status::success();
}

common::Result<std::vector<VectorSearchResult>>
VectorIndex::search(const std::vector<float> &query, const std::size_t k,
                    const CandidateFilter &filter) const {
  using SearchResult = common::Result<std::vector<VectorSearchResult>>;
  if (query.size() != dimensions_) {
    return SearchResult::failure(common::ErrorCode::DimensionMismatch,
                                 to_string(modality_) + " query has " +
                                     std::to_string(query.size()) + " dimensions, expected " +
                                     std::to_string(dimensions_));
  }

  std::vector<float> probe = query;
  if (metric_ == Metric::InnerProduct) {
    l2_normalize(probe);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  // (rank key, slot): smaller key is better for both metrics.
  std::vector<std::pair<float, std::size_t>> scored;
  scored.reserve(live_count_);
  for (std::size_t slot = 0; slot < slot_ids_.size(); ++slot) {
    if (!live_[slot] || (filter && !filter(slot_ids_[slot]))) {
      continue;
    }
    const float *row = data_.data() + slot * dimensions_;
    double acc = 0.0;
    if (metric_ == Metric::L2) {
      for (std::size_t i = 0; i < dimensions_; ++i) {
        const double diff = static_cast<double>(row[i]) - static_cast<double>(probe[i]);
        acc += diff * diff;
      }
      scored.emplace_back(static_cast<float>(acc), slot);
    } else {
      for (std::size_t i = 0; i < dimensions_; ++i) {
        acc += static_cast<double>(row[i]) * static_cast<double>(probe[i]);
      }
      scored.emplace_back(static_cast<float>(-acc), slot);
    }
  }

  const std::size_t take = std::min(k, scored.size());
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(take),
                    scored.end());

  std::vector<VectorSearchResult> results;
  results.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    const auto [key, slot] = scored[i];
    VectorSearchResult result{.id = slot_ids_[slot], .slot = slot};
    if (metric_ == Metric::L2) {
      result.distance = key;
      result.score = 1.0F / (1.0F + key);
    } else {
      result.score = -key;
      result.distance = 1.0F + key;
    }
    results.push_back(std::move(result));
  }
  return SearchResult::success(std::move(results));
}

std::size_t VectorIndex::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_count_;
}

std::size_t VectorIndex::slot_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slot_ids_.size();
}

std::optional<std::string> VectorIndex::id_at(const std::size_t slot) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (slot >= slot_ids_.size() || !live_[slot]) {
    return std::nullopt;
  }
  return slot_ids_[slot];
}

std::vector<std::pair<std::size_t, std::string>> VectorIndex::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::size_t, std::string>> out;
  out.reserve(live_count_);
  for (std::size_t slot = 0; slot < slot_ids_.size(); ++slot) {
    if (live_[slot]) {
      out.emplace_back(slot, slot_ids_[slot]);
    }
  }
  return out;
}

void VectorIndex::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.clear();
  slot_ids_.clear();
  live_.clear();
  id_to_slot_.clear();
  live_count_ = 0;
}

std::string VectorIndex::file_stem() const {
  return to_string(modality_) + "-" + to_string(metric_) + "-" + std::to_string(dimensions_);
}

common::Status VectorIndex::persist(const std::filesystem::path &dir) const {
  if (auto ensured = common::ensure_dir(dir); !ensured.ok()) {
    return ensured.status();
  }

  std::string vec_file;
  std::string map_file;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const FileHeader header{.version = kFormatVersion,
                            .modality = static_cast<std::uint32_t>(modality_),
                            .metric = static_cast<std::uint32_t>(metric_),
                            .dimensions = dimensions_,
                            .slot_count = slot_ids_.size()};

    vec_file.reserve(64 + data_.size() * sizeof(float));
    put_header(vec_file, kVecMagic, header);
    vec_file.append(reinterpret_cast<const char *>(data_.data()), data_.size() * sizeof(float));
    append_digest(vec_file);

    put_header(map_file, kMapMagic, header);
    // The map pins the exact vector file it belongs to.
    map_file.append(vec_file.data() + vec_file.size() - kDigestSize, kDigestSize);
    for (std::size_t slot = 0; slot < slot_ids_.size(); ++slot) {
      put(map_file, static_cast<std::uint8_t>(live_[slot] ? 1 : 0));
      put(map_file, static_cast<std::uint32_t>(slot_ids_[slot].size()));
      map_file.append(slot_ids_[slot]);
    }
    append_digest(map_file);
  }

  const auto stem = file_stem();
  if (auto written = common::write_file_atomic(dir / (stem + ".vec"), vec_file); !written.ok()) {
    return written;
  }
  return common::write_file_atomic(dir / (stem + ".map"), map_file);
}

common::Status VectorIndex::load(const std::filesystem::path &dir) {
  const auto stem = file_stem();
  const auto vec_path = dir / (stem + ".vec");
  const auto map_path = dir / (stem + ".map");
  std::error_code ec;
  const bool has_vec = std::filesystem::exists(vec_path, ec);
  const bool has_map = std::filesystem::exists(map_path, ec);
  if (!has_vec && !has_map) {
    clear();
    return common::Status::success();
  }
  if (has_vec != has_map) {
    clear();
    return corrupt(stem + ": " + (has_vec ? "slot map" : "vector data") + " file is missing");
  }

  auto vec_file = common::read_file(vec_path);
  if (!vec_file.ok()) {
    return vec_file.status();
  }
  auto map_file = common::read_file(map_path);
  if (!map_file.ok()) {
    return map_file.status();
  }

  clear();
  const auto vec_body = verified_body(vec_file.value());
  if (!vec_body.has_value()) {
    return corrupt(stem + ".vec checksum mismatch");
  }
  const auto map_body = verified_body(map_file.value());
  if (!map_body.has_value()) {
    return corrupt(stem + ".map checksum mismatch");
  }

  Reader vec_reader(*vec_body);
  FileHeader vec_header;
  if (!read_header(vec_reader, kVecMagic, vec_header) || vec_header.version != kFormatVersion) {
    return corrupt(stem + ".vec has an unknown header");
  }
  if (vec_header.modality != static_cast<std::uint32_t>(modality_) ||
      vec_header.metric != static_cast<std::uint32_t>(metric_) ||
      vec_header.dimensions != dimensions_) {
    return corrupt(stem + ".vec was written for a different index shape");
  }
  const std::size_t float_count = static_cast<std::size_t>(vec_header.slot_count) * dimensions_;
  if (vec_reader.remaining() != float_count * sizeof(float)) {
    return corrupt(stem + ".vec payload size does not match its header");
  }

  Reader map_reader(*map_body);
  FileHeader map_header;
  std::string_view pinned_digest;
  if (!read_header(map_reader, kMapMagic, map_header) ||
      map_header.version != vec_header.version || map_header.modality != vec_header.modality ||
      map_header.metric != vec_header.metric || map_header.dimensions != vec_header.dimensions ||
      map_header.slot_count != vec_header.slot_count ||
      !map_reader.get_bytes(kDigestSize, pinned_digest)) {
    return corrupt(stem + ".map does not match " + stem + ".vec");
  }
  if (std::memcmp(pinned_digest.data(), vec_body->data() + vec_body->size(), kDigestSize) != 0) {
    return corrupt(stem + ".map is stale relative to " + stem + ".vec");
  }

  std::vector<std::string> slot_ids;
  std::vector<bool> live;
  std::unordered_map<std::string, std::size_t> id_to_slot;
  std::size_t live_count = 0;
  slot_ids.reserve(vec_header.slot_count);
  live.reserve(vec_header.slot_count);
  for (std::uint64_t slot = 0; slot < vec_header.slot_count; ++slot) {
    std::uint8_t is_live = 0;
    std::uint32_t id_size = 0;
    std::string_view id;
    if (!map_reader.get(is_live) || !map_reader.get(id_size) ||
        !map_reader.get_bytes(id_size, id)) {
      return corrupt(stem + ".map is truncated");
    }
    if (is_live != 0) {
      if (!id_to_slot.emplace(std::string(id), static_cast<std::size_t>(slot)).second) {
        return corrupt(stem + ".map maps two slots to " + std::string(id));
      }
      ++live_count;
    }
    slot_ids.emplace_back(id);
    live.push_back(is_live != 0);
  }
  if (map_reader.remaining() != 0) {
    return corrupt(stem + ".map has trailing data");
  }

  std::vector<float> data(float_count);
  std::string_view payload;
  if (!vec_reader.get_bytes(float_count * sizeof(float), payload)) {
    return corrupt(stem + ".vec is truncated");
  }
  if (!payload.empty()) {
    std::memcpy(data.data(), payload.data(), payload.size());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  data_ = std::move(data);
  slot_ids_ = std::move(slot_ids);
  live_ = std::move(live);
  id_to_slot_ = std::move(id_to_slot);
  live_count_ = live_count;
  return common::Status::success();
}

} // namespace memoryos::memory
