/* SPDX-License-Identifier: MIT */

#include <handcad/realtime/FrameSource.hpp>
#include <handcad/core/Logger.hpp>

namespace handcad {
namespace realtime {

void FrameSource::onRejected(const core::Exception& error) {
    LOG_WARNING("FrameSource: frame rejected (" + resultCodeToString(error.getResultCode()) +
                "): " + error.getMessage());
}

} // namespace realtime
} // namespace handcad
