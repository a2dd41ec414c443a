#pragma once
#include "../core/containers.hpp"
#include "../core/exceptions.hpp"
#include "../core/interval.hpp"
#include "access_concepts.hpp"
#include <expected>
#include <span>
#include <vector>

namespace localderiv::access {

/**
 * @brief Dense n-dimensional image of doubles, axis 0 varying fastest.
 *
 * Pixel coordinates run from 0 to dimension(d) - 1. Cursors are opened on an
 * access interval and throw core::AccessError when reading outside that interval
 * or outside the image.
 */
class ArrayImage {
private:
  std::vector<core::Index> dimensions_;
  std::vector<std::size_t> strides_;
  std::vector<double> data_;
  core::Interval extent_;

  ArrayImage(std::vector<core::Index> dimensions, core::Interval extent);

public:
  class Cursor {
  private:
    const ArrayImage* image_;
    core::Interval access_;
    core::Position position_;

  public:
    Cursor(const ArrayImage& image, core::Interval access);

    [[nodiscard]] auto num_dimensions() const noexcept -> std::size_t { return position_.size(); }
    [[nodiscard]] auto position(std::size_t d) const noexcept -> core::Index { return position_[d]; }
    [[nodiscard]] auto position() const noexcept -> std::span<const core::Index> { return position_; }
    void localize(std::span<core::Index> out) const;

    void set_position(std::span<const core::Index> position);
    void set_position(core::Index value, std::size_t d) { position_[d] = value; }
    void move(core::Index delta, std::size_t d) { position_[d] += delta; }

    [[nodiscard]] auto access_interval() const noexcept -> const core::Interval& { return access_; }

    // Throws core::AccessError outside the access interval or the image.
    [[nodiscard]] auto get() const -> double;
  };

  [[nodiscard]] static auto create(std::span<const core::Index> dimensions)
      -> std::expected<ArrayImage, core::GeometryError>;

  [[nodiscard]] auto num_dimensions() const noexcept -> std::size_t { return dimensions_.size(); }
  [[nodiscard]] auto dimension(std::size_t d) const noexcept -> core::Index { return dimensions_[d]; }
  [[nodiscard]] auto interval() const noexcept -> const core::Interval& { return extent_; }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return data_.size(); }

  // The cursor points into this image, so it is not handed out by temporaries.
  [[nodiscard]] auto cursor(const core::Interval& access) const& -> Cursor { return Cursor(*this, access); }
  auto cursor(const core::Interval& access) const&& -> Cursor = delete;

  // Unchecked linear offset of an in-bounds position.
  [[nodiscard]] auto offset_of(std::span<const core::Index> position) const noexcept -> std::size_t;

  [[nodiscard]] auto at(std::span<const core::Index> position) const -> double;
  void set(std::span<const core::Index> position, double value);

  [[nodiscard]] auto data() noexcept -> std::span<double> { return data_; }
  [[nodiscard]] auto data() const noexcept -> std::span<const double> { return data_; }
};

static_assert(ScalarCursor<ArrayImage::Cursor>);
static_assert(BoundedScalarSource<ArrayImage>);

} // namespace localderiv::access
