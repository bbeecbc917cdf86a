#pragma once

#include <simq/mqtt/logger.hpp>
#include <simq/mqtt/time_utils.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace simq::mqtt {

    /// @brief Outcome reported through the status callback for a packet id.
    enum class DeliveryStatus : uint8_t {
        TIMEOUT = 0,      // no acknowledgment within message_timeout
        DELIVERED = 1,    // PUBACK / SUBACK received
        UNKNOWN_PID = 2   // PUBACK for an id not awaiting one, possibly already expired
    };

    inline std::string_view to_string(DeliveryStatus s) {
        switch (s) {
        case DeliveryStatus::TIMEOUT:     return "TIMEOUT";
        case DeliveryStatus::DELIVERED:   return "DELIVERED";
        case DeliveryStatus::UNKNOWN_PID: return "UNKNOWN_PID";
        default:                          return "UNKNOWN";
        }
    }

    inline std::ostream& operator<<(std::ostream& os, DeliveryStatus s) {
        return os << to_string(s);
    }

    using StatusCallback = std::function<void(uint16_t packet_id, DeliveryStatus status)>;

    // Packet ids sent with QoS 1 PUBLISH or SUBSCRIBE, mapped to the tick at
    // which they are declared lost. Every entry leaves the table exactly once,
    // through resolve() or sweep(), and the status callback runs after removal.
    class PendingAckTable {
    private:
        std::map<uint16_t, Ticks> deadlines_;
        uint32_t message_timeout_ms_;
        StatusCallback on_status_;

        void notify(uint16_t packet_id, DeliveryStatus status) const {
            if (on_status_) {
                on_status_(packet_id, status);
            }
        }

    public:
        explicit PendingAckTable(uint32_t message_timeout_ms)
            : message_timeout_ms_(message_timeout_ms) {}

        void set_status_callback(StatusCallback callback) {
            on_status_ = std::move(callback);
        }

        void register_pid(uint16_t packet_id, Ticks now) {
            Ticks deadline = ticks_add(now, message_timeout_ms_);
            auto [it, inserted] = deadlines_.insert_or_assign(packet_id, deadline);
            if (!inserted) {
                SIMQ_LOG_WARN("ACKS") << "Packet id " << packet_id
                    << " reissued while still awaiting acknowledgment";
            }
        }

        // Removes packet_id and reports DELIVERED. Returns false, without
        // reporting anything, when the id is not pending.
        bool resolve(uint16_t packet_id) {
            auto it = deadlines_.find(packet_id);
            if (it == deadlines_.end()) {
                return false;
            }

            deadlines_.erase(it);
            notify(packet_id, DeliveryStatus::DELIVERED);
            return true;
        }

        void report_unknown(uint16_t packet_id) const {
            notify(packet_id, DeliveryStatus::UNKNOWN_PID);
        }

        // Expires every entry whose deadline is not after now. Returns the
        // number of entries expired.
        size_t sweep(Ticks now) {
            std::vector<uint16_t> expired;
            for (const auto& [packet_id, deadline] : deadlines_) {
                if (ticks_diff(deadline, now) <= 0) {
                    expired.push_back(packet_id);
                }
            }

            // Erase everything first: a callback may publish and register again.
            for (uint16_t packet_id : expired) {
                deadlines_.erase(packet_id);
            }
            for (uint16_t packet_id : expired) {
                SIMQ_LOG_DEBUG("ACKS") << "Packet id " << packet_id << " timed out";
                notify(packet_id, DeliveryStatus::TIMEOUT);
            }

            return expired.size();
        }

        bool contains(uint16_t packet_id) const {
            return deadlines_.find(packet_id) != deadlines_.end();
        }

        std::optional<Ticks> deadline(uint16_t packet_id) const {
            auto it = deadlines_.find(packet_id);
            if (it == deadlines_.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        size_t size() const { return deadlines_.size(); }
        bool empty() const { return deadlines_.empty(); }

        void clear() { deadlines_.clear(); }
    };

} // namespace simq::mqtt
