#include "localderiv/access/array_image.hpp"
#include "test_support.hpp"
#include <vector>

using namespace localderiv;

int main() {
  int failures = 0;

  try {
    const std::vector<core::Index> dims = {4, 3};
    auto created = access::ArrayImage::create(dims);
    if (!created) {
      std::cerr << created.error().message() << "\n";
      return 1;
    }
    auto image = std::move(created.value());
    test::expect(image.size() == 12, "pixel count", failures);

    // Axis 0 varies fastest.
    const std::vector<core::Index> p = {2, 1};
    test::expect(image.offset_of(p) == 6, "linear offset", failures);
    image.set(p, 7.5);
    test::expect(image.at(p) == 7.5 && image.data()[6] == 7.5, "set and read back", failures);

    auto cursor = image.cursor(test::box({1, 0}, {2, 1}));
    cursor.set_position(p);
    test::expect(cursor.get() == 7.5, "cursor read", failures);

    cursor.move(-1, 0);
    std::vector<core::Index> local(2);
    cursor.localize(local);
    test::expect(local == std::vector<core::Index>{1, 1}, "cursor move and localize", failures);

    // Outside the access interval, inside the image.
    cursor.set_position(3, 0);
    bool thrown = false;
    try {
      static_cast<void>(cursor.get());
    } catch (const core::AccessError&) {
      thrown = true;
    }
    test::expect(thrown, "read outside the access interval throws", failures);

    // Access interval larger than the image still stops at the image border.
    auto wide = image.cursor(test::box({-1, -1}, {4, 3}));
    wide.set_position(std::vector<core::Index>{-1, 0});
    thrown = false;
    try {
      static_cast<void>(wide.get());
    } catch (const core::AccessError&) {
      thrown = true;
    }
    test::expect(thrown, "read outside the image throws", failures);

    thrown = false;
    try {
      image.set(std::vector<core::Index>{4, 0}, 1.0);
    } catch (const core::AccessError&) {
      thrown = true;
    }
    test::expect(thrown, "write outside the image throws", failures);

    const std::vector<core::Index> bad = {4, -2};
    test::expect(!access::ArrayImage::create(bad), "negative dimension rejected", failures);

  } catch (const core::LocalDerivException& e) {
    std::cerr << "Unexpected exception: " << e.full_message() << "\n";
    return 1;
  }

  if (failures > 0) {
    std::cerr << failures << " image check(s) failed\n";
    return 1;
  }
  std::cout << "array image OK\n";
  return 0;
}
