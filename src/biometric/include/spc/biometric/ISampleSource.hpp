/**
 * @file ISampleSource.hpp
 * @brief Audio capture collaborator used by voice enrollment.
 * @author MasterLaplace
 */

#pragma once

#include <spc/core/Expected.hpp>
#include <spc/core/Types.hpp>

#include <vector>

namespace spc::biometric {

/**
 * @brief Delivers one recorded utterance as signed 16-bit PCM.
 *
 * A source that cannot record (no microphone, permission denied) returns
 * @c kResourceUnavailable.  The core surfaces that error unchanged and
 * never retries.
 */
class ISampleSource {
public:
    virtual ~ISampleSource() = default;

    [[nodiscard]] virtual core::Expected<std::vector<core::i16>> capture() = 0;
};

} // namespace spc::biometric
