#include "localderiv/access/array_image.hpp"
#include <algorithm>
#include <format>
#include <numeric>

namespace localderiv::access {

namespace {

auto format_position(std::span<const core::Index> position) -> std::string {
  std::string out = "(";
  for (std::size_t i = 0; i < position.size(); ++i) {
    out += std::format("{}{}", i == 0 ? "" : ", ", position[i]);
  }
  return out + ")";
}

} // namespace

ArrayImage::ArrayImage(std::vector<core::Index> dimensions, core::Interval extent)
    : dimensions_(std::move(dimensions)), extent_(std::move(extent)) {
  strides_.resize(dimensions_.size());
  std::size_t stride = 1;
  for (std::size_t d = 0; d < dimensions_.size(); ++d) {
    strides_[d] = stride;
    stride *= static_cast<std::size_t>(dimensions_[d]);
  }
  data_.assign(stride, 0.0);
}

auto ArrayImage::create(std::span<const core::Index> dimensions) -> std::expected<ArrayImage, core::GeometryError> {
  auto extent = core::Interval::from_dimensions(dimensions);
  if (!extent) {
    return std::unexpected(extent.error());
  }
  return ArrayImage(std::vector<core::Index>(dimensions.begin(), dimensions.end()), std::move(extent.value()));
}

auto ArrayImage::offset_of(std::span<const core::Index> position) const noexcept -> std::size_t {
  std::size_t offset = 0;
  for (std::size_t d = 0; d < strides_.size(); ++d) {
    offset += static_cast<std::size_t>(position[d]) * strides_[d];
  }
  return offset;
}

auto ArrayImage::at(std::span<const core::Index> position) const -> double {
  if (!extent_.contains(position)) {
    throw core::AccessError(
        std::format("position {} outside image {}", format_position(position), extent_.to_string()));
  }
  return data_[offset_of(position)];
}

void ArrayImage::set(std::span<const core::Index> position, double value) {
  if (!extent_.contains(position)) {
    throw core::AccessError(
        std::format("position {} outside image {}", format_position(position), extent_.to_string()));
  }
  data_[offset_of(position)] = value;
}

ArrayImage::Cursor::Cursor(const ArrayImage& image, core::Interval access)
    : image_(&image), access_(std::move(access)), position_(image.num_dimensions(), 0) {
  if (access_.num_dimensions() != image.num_dimensions()) {
    throw core::GeometryError(std::format("access interval has {} axes, image has {}", access_.num_dimensions(),
                                          image.num_dimensions()));
  }
}

void ArrayImage::Cursor::localize(std::span<core::Index> out) const {
  std::copy_n(position_.begin(), std::min(out.size(), position_.size()), out.begin());
}

void ArrayImage::Cursor::set_position(std::span<const core::Index> position) {
  if (position.size() != position_.size()) {
    throw core::GeometryError(
        std::format("position has {} axes, cursor has {}", position.size(), position_.size()));
  }
  std::ranges::copy(position, position_.begin());
}

auto ArrayImage::Cursor::get() const -> double {
  if (!access_.contains(position_)) {
    throw core::AccessError(std::format("read at {} outside access interval {}", format_position(position_),
                                        access_.to_string()));
  }
  return image_->at(position_);
}

} // namespace localderiv::access
