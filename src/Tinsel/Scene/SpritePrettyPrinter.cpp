//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <algorithm>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <Tinsel/Scene/SpritePrettyPrinter.h>
#include <Tinsel/Scene/SpriteTraversal.h>

namespace tinsel::scene {

namespace {

  //! Character sets for tree visualization
  struct TreeChars {
    const char* branch; // ├──
    const char* last_child; // └──
    const char* continuation; // │
    const char* spacing; // (spaces)
  };

  constexpr TreeChars kAsciiChars = {
    .branch = "|-- ",
    .last_child = "`-- ",
    .continuation = "|   ",
    .spacing = "    ",
  };

  constexpr TreeChars kUnicodeChars = {
    .branch = "├── ", // U+251C, U+2500, U+2500, space
    .last_child = "└── ", // U+2514, U+2500, U+2500, space
    .continuation = "│   ", // U+2502, space, space, space
    .spacing = "    ",
  };

  auto GetTreeChars(const CharacterSet charset) -> const TreeChars&
  {
    switch (charset) {
    case CharacterSet::kAscii:
      return kAsciiChars;
    case CharacterSet::kUnicode:
      return kUnicodeChars;
    }
    return kAsciiChars;
  }

  auto FormatLabel(const Sprite& sprite, const PrintOptions& options)
    -> std::string
  {
    auto label = to_string(sprite.GetId());
    label.resize(std::min(label.size(), options.id_length));

    if (options.verbosity == VerbosityLevel::kNone) {
      return label;
    }

    std::vector<std::string> parts;
    if (!sprite.IsVisible()) {
      parts.emplace_back("hidden");
    }
    if (sprite.IsFlipX()) {
      parts.emplace_back("flip-x");
    }
    if (sprite.IsFlipY()) {
      parts.emplace_back("flip-y");
    }
    if (const auto clip = sprite.GetActiveFrameSetName()) {
      parts.push_back(fmt::format("clip={}#{}", *clip, sprite.GetFrameIndex()));
      if (const auto followup = sprite.GetFollowup()) {
        parts.push_back(fmt::format("then={}", *followup));
      }
    }

    if (options.verbosity == VerbosityLevel::kDetailed) {
      const auto& position = sprite.GetPosition();
      const auto& scale = sprite.GetScale();
      const auto& anchor = sprite.GetAnchor();
      const auto& color = sprite.GetColor();
      parts.push_back(fmt::format("pos=({}, {})", position.x, position.y));
      parts.push_back(fmt::format("rot={}", sprite.GetRotation()));
      parts.push_back(fmt::format("scale=({}, {})", scale.x, scale.y));
      parts.push_back(fmt::format("anchor=({}, {})", anchor.x, anchor.y));
      parts.push_back(fmt::format("tint=({}, {}, {}, {})", color.r, color.g,
        color.b, sprite.GetOpacity()));
      parts.push_back(fmt::format(
        "src={}", graphics::to_string(sprite.GetActiveSourceRect())));
    }

    if (parts.empty()) {
      return label;
    }
    return fmt::format("{} [{}]", label, fmt::join(parts, ", "));
  }

  auto FormatChildren(const Sprite& parent, const std::string& prefix,
    const std::ptrdiff_t depth, const PrintOptions& options,
    std::vector<std::string>& lines) -> void
  {
    if (options.max_depth >= 0 && depth > options.max_depth) {
      return;
    }

    const auto& chars = GetTreeChars(options.charset);
    const auto& children = parent.GetChildren();
    for (std::size_t i = 0; i < children.size(); ++i) {
      const bool is_last = i + 1 == children.size();
      lines.push_back(fmt::format("{}{}{}", prefix,
        is_last ? chars.last_child : chars.branch,
        FormatLabel(children[i], options)));
      FormatChildren(children[i],
        prefix + (is_last ? chars.spacing : chars.continuation), depth + 1,
        options, lines);
    }
  }

} // namespace

auto FormatSpriteTree(const Sprite& root, const PrintOptions& options)
  -> std::vector<std::string>
{
  std::vector<std::string> lines;
  lines.push_back(FormatLabel(root, options));
  FormatChildren(root, "", 1, options, lines);
  return lines;
}

auto LogSpriteTree(const Sprite& root, const loguru::Verbosity verbosity,
  const PrintOptions& options) -> void
{
  const auto lines = FormatSpriteTree(root, options);
  VLOG_SCOPE_F(verbosity,
    fmt::format("Sprite tree ({} sprites)", CountSprites(root)).c_str());
  for (const auto& line : lines) {
    VLOG_F(verbosity, "{}", line);
  }
}

} // namespace tinsel::scene
