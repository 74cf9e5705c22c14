#include <array>
#include <cstdint>
#include <format>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "core/friendly_id.hpp"
#include "core/json.hpp"
#include "core/kind.hpp"
#include "core/typed_id.hpp"
#include "kinds/document_type.hpp"
#include "kinds/user_type.hpp"

DEFINE_int32(count, 2, "Identifiers to generate per kind");

namespace {

/// A descriptor written by hand: sparse tags, names chosen freely.
enum class Shape {
  Circle,
  Square,
};

}  // namespace

template <>
struct tuid::core::KindTraits<Shape> {
  static constexpr std::string_view type_name = "Shape";

  static auto tag(Shape shape) -> std::uint8_t {
    return shape == Shape::Circle ? 10 : 20;
  }
  static auto from_tag(std::uint8_t tag) -> std::optional<Shape> {
    switch (tag) {
      case 10:
        return Shape::Circle;
      case 20:
        return Shape::Square;
      default:
        return std::nullopt;
    }
  }
  static auto name(Shape shape) -> std::string_view {
    return shape == Shape::Circle ? "circle" : "square";
  }
};

namespace {

template <tuid::core::KindDescriptor K>
auto show(K kind) -> void {
  for (int i = 0; i < FLAGS_count; ++i) {
    auto id = tuid::core::TypedId<K>::generate(kind);
    tuid::core::FriendlyId<K> friendly(id);
    std::cout << std::format("  {:<14} tag={:<3} {}  {}\n", friendly.name(), id.tag(), id,
                             friendly);
  }
}

auto show_parse(std::string_view text) -> void {
  auto parsed = tuid::core::FriendlyId<demo::UserType>::parse(text);
  if (parsed) {
    std::cout << std::format("  ok    {} -> tag {}\n", text, parsed->typed_id().tag());
  } else {
    std::cout << std::format("  {:<5} {} ({})\n", tuid::core::to_string(parsed.error().code),
                             text, parsed.error().message);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage("tuid_demo [--count=N]");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  tuid::log::init();

  constexpr std::array kShapes{Shape::Circle, Shape::Square};
  auto verified = tuid::core::verify_kind_descriptor<Shape>(std::span<const Shape>(kShapes));
  if (!verified) {
    tuid::log::error("descriptor check failed: {}", verified.error().message);
    return 1;
  }
  tuid::log::info("Shape descriptor assigns {} tags", *verified);

  std::cout << "Generated identifiers:\n";
  show(demo::UserType::Retail);
  show(demo::UserType::Business);
  show(demo::UserType::Organization);
  show(demo::DocumentType::PurchaseOrder);
  show(demo::ServiceType::HTTPServer);
  show(Shape::Square);

  auto retail = tuid::core::FriendlyId<demo::UserType>::generate(demo::UserType::Retail);
  const auto text = retail.to_string();
  const auto uuid_text = text.substr(text.size() - tuid::core::Uuid::kTextSize);

  std::cout << "\nParsing:\n";
  show_parse(text);
  show_parse("business_" + uuid_text);
  show_parse("retail_" + uuid_text.substr(0, 35) + "g");
  show_parse("retail_1234");
  show_parse("retail_00000000-0000-8000-8000-0000000000ff");

  nlohmann::json doc{{"owner", retail}, {"id", retail.typed_id()}};
  std::cout << "\nJSON:\n  " << doc.dump() << "\n";

  tuid::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return 0;
}
