//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#include <string>
#include <utility>

#include <Tinsel/Base/Logging.h>
#include <Tinsel/Scene/Sprite.h>

using tinsel::scene::Sprite;

auto Sprite::AddFrameSet(const std::string_view name, const bool repeat,
  const double frame_time, std::vector<Rect> frames) -> bool
{
  if (frames.empty()) {
    LOG_F(WARNING, "sprite {}: frame set '{}' has no frames, ignored",
      to_string(id_), name);
    return false;
  }

  const auto [it, inserted] = frame_sets_.try_emplace(std::string(name),
    FrameSet {
      .repeat = repeat,
      .frame_time = frame_time,
      .frames = std::move(frames),
    });
  if (!inserted) {
    DLOG_F(1, "sprite {}: frame set '{}' already registered, ignored",
      to_string(id_), name);
    return false;
  }

  DLOG_F(2, "sprite {}: frame set '{}' registered ({} frames, {}s, {})",
    to_string(id_), name, it->second.GetFrameCount(), frame_time,
    repeat ? "repeat" : "once");
  return true;
}

auto Sprite::AddFrameSetHorizontal(const std::string_view name,
  const bool repeat, const double frame_time, const Rect& base,
  const std::uint32_t count) -> bool
{
  return AddFrameSet(
    name, repeat, frame_time, MakeHorizontalFrames(base, count));
}

auto Sprite::GetFrameSet(const std::string_view name) const
  -> OptionalFrameSetRef
{
  if (const auto it = frame_sets_.find(std::string(name));
    it != frame_sets_.end()) {
    return std::cref(it->second);
  }
  return std::nullopt;
}

/*!
 If `name` is registered, its frame set becomes the active clip. Starting a
 clip does not rewind it: the frame index and the elapsed time carry over, so
 that calling Play() every frame with the same name keeps the animation
 running. A frame index beyond the end of the new clip restarts it at its
 first frame.

 The followup is always updated, even when `name` is unknown: it is set to
 `followup`, or cleared when none is given.

 @param name Name of a registered frame set.
 @param followup Clip to chain to once this one has shown its last frame,
 even if it repeats.
 @return `true` if the clip is now active; `false` if `name` is not
 registered, in which case the active clip, if any, is left as is.
*/
auto Sprite::Play(const std::string_view name,
  const std::optional<std::string_view> followup) -> bool
{
  if (followup) {
    followup_ = std::string(*followup);
  } else {
    followup_.reset();
  }

  const auto it = frame_sets_.find(std::string(name));
  if (it == frame_sets_.end()) {
    LOG_F(WARNING, "sprite {}: cannot play unknown frame set '{}'",
      to_string(id_), name);
    return false;
  }

  active_ = ActiveClip { .name = it->first, .frame_set = it->second };
  if (frame_index_ >= active_->frame_set.GetFrameCount()) {
    frame_index_ = 0;
  }

  DLOG_F(1, "sprite {}: playing '{}' from frame {}{}", to_string(id_), name,
    frame_index_, followup_ ? ", then '" + *followup_ + "'" : std::string {});
  return true;
}

auto Sprite::Stop() noexcept -> void
{
  active_.reset();
  followup_.reset();
  frame_index_ = 0;
  frame_elapsed_ = 0.0;
}

/*!
 Accumulates `dt` and, once a full frame time has elapsed, resets the
 accumulator and moves the clip forward by exactly one frame. Large `dt`
 values never skip frames.

 When the last frame has been shown for its full time:
 - with a followup, the followup clip starts from its first frame, with no
   further followup. It takes precedence over `repeat`;
 - otherwise, a repeating clip goes back to its first frame;
 - otherwise, the clip stays on its last frame.

 Does nothing while no clip is active.
*/
auto Sprite::Update(const double dt) -> void
{
  if (!active_) {
    return;
  }

  frame_elapsed_ += dt;
  if (frame_elapsed_ < active_->frame_set.frame_time) {
    return;
  }
  frame_elapsed_ = 0.0;

  if (!active_->frame_set.IsLastFrame(frame_index_)) {
    ++frame_index_;
    return;
  }

  if (followup_) {
    frame_index_ = 0;
    // Play() clears the followup, chains are one hop deep.
    const auto next = *followup_;
    if (!Play(next)) {
      DLOG_F(1, "sprite {}: followup '{}' unavailable, restarting '{}'",
        to_string(id_), next, active_->name);
    }
    return;
  }

  if (active_->frame_set.repeat) {
    frame_index_ = 0;
  }
}

auto Sprite::GetActiveFrameSetName() const noexcept
  -> std::optional<std::string_view>
{
  if (active_) {
    return active_->name;
  }
  return std::nullopt;
}

auto Sprite::GetFollowup() const noexcept -> std::optional<std::string_view>
{
  if (followup_) {
    return *followup_;
  }
  return std::nullopt;
}
