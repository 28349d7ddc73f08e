/**
 * @file transfer_queue.h
 * @brief Main header for the transfer_queue library
 * @version 0.1.0
 *
 * Include this header to access the download queue, its remote session
 * abstraction and the supporting utilities.
 *
 * @code
 * #include <transfer_queue/transfer_queue.h>
 *
 * using namespace transfer_queue;
 *
 * auto settings = app_settings::load(app_settings::default_path());
 * auto scheduler = queue_scheduler::builder()
 *     .with_config(scheduler_config::from_settings(settings.value()))
 *     .with_session_factory([] { return std::make_shared<local_directory_session>("/srv"); })
 *     .build();
 * @endcode
 */

#ifndef TRANSFER_QUEUE_TRANSFER_QUEUE_H
#define TRANSFER_QUEUE_TRANSFER_QUEUE_H

#include <cstdint>
#include <string>

// Core
#include "transfer_queue/core/types.h"
#include "transfer_queue/core/logging.h"
#include "transfer_queue/core/checksum.h"
#include "transfer_queue/core/checksum_verifier.h"
#include "transfer_queue/core/bandwidth_limiter.h"
#include "transfer_queue/core/speed_tracker.h"

// Configuration
#include "transfer_queue/config/app_settings.h"

// Sessions
#include "transfer_queue/session/remote_session.h"
#include "transfer_queue/session/local_directory_session.h"
#include "transfer_queue/session/reconnect_supervisor.h"

// Queue
#include "transfer_queue/queue/transfer_record.h"
#include "transfer_queue/queue/persistence_store.h"
#include "transfer_queue/queue/transfer_worker.h"
#include "transfer_queue/queue/queue_scheduler.h"

// Adapters
#include "transfer_queue/adapters/thread_pool_adapter.h"

namespace transfer_queue {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace transfer_queue

#endif  // TRANSFER_QUEUE_TRANSFER_QUEUE_H
