#pragma once

#include <cstdint>

namespace simq::mqtt {

    /// @brief Issues packet identifiers 1, 2, ..., 65535, 1, ... and never 0.
    ///
    /// Owned by a single client. The allocator does not consult the pending-ack
    /// table, so an id can be reissued while an older use of it is still
    /// awaiting its acknowledgment if 65535 requests are left unresolved.
    class PacketIdAllocator {
    private:
        uint16_t last_ = 0;

    public:
        uint16_t next() {
            last_ = (last_ < 0xFFFF) ? static_cast<uint16_t>(last_ + 1) : 1;
            return last_;
        }

        // Last issued id, 0 before the first call.
        uint16_t last() const { return last_; }

        void reset() { last_ = 0; }
    };

} // namespace simq::mqtt
