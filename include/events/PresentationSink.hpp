/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PRESENTATION_SINK_HPP
#define PRESENTATION_SINK_HPP

#include "core/Logger.hpp"
#include <exception>
#include <string>

namespace Driftwood {

struct Tile;
struct GridCoord;

/**
 * @brief Observer for visual/audio feedback of the build loop
 *
 * Calls are synchronous and fire-and-forget. The presentation layer keys its
 * visuals by tile id and never owns simulation state. Implementations should
 * not throw; if one does, the core logs it and carries on.
 */
class PresentationSink {
public:
  virtual ~PresentationSink() = default;

  virtual void tilePlaced(const Tile & /*tile*/, const GridCoord & /*cell*/) {}
  virtual void tileRemoved(const GridCoord & /*cell*/) {}
  virtual void buildModeStarted(const std::string & /*itemId*/) {}
  virtual void buildModeCancelled() {}
  virtual void placementInvalid(const std::string & /*reason*/) {}
};

// Invoke a sink callback, tolerating a null sink and logging throws
template <typename Fn>
void notifySink(PresentationSink *sink, const char *what, Fn &&fn) {
  if (sink == nullptr) {
    return;
  }
  try {
    fn(*sink);
  } catch (const std::exception &e) {
    DRIFT_ERROR("PresentationSink",
                std::string("Sink threw during ") + what + ": " + e.what());
  }
}

} // namespace Driftwood

#endif // PRESENTATION_SINK_HPP
