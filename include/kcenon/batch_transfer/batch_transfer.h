/**
 * @file batch_transfer.h
 * @brief Main header for the batch_transfer library
 * @version 0.1.0
 *
 * @code
 * #include <kcenon/batch_transfer/batch_transfer.h>
 *
 * using namespace kcenon::batch_transfer;
 *
 * auto controller = batch_controller::builder()
 *     .with_connector(std::make_shared<sftp_connector>())
 *     .build();
 *
 * batch_request request;
 * request.session = {"sftp.example.com", 22, "deploy"};
 * request.files = {"a.csv", "b.csv"};
 * request.policy.inter_file_delay = std::chrono::seconds(60);
 *
 * auto handle = controller.value().start(request);
 * @endcode
 */

#ifndef KCENON_BATCH_TRANSFER_BATCH_TRANSFER_H
#define KCENON_BATCH_TRANSFER_BATCH_TRANSFER_H

#include <string>

#include "kcenon/batch_transfer/config/feature_flags.h"

// Core
#include "kcenon/batch_transfer/core/types.h"
#include "kcenon/batch_transfer/core/batch_types.h"
#include "kcenon/batch_transfer/core/cancellation.h"
#include "kcenon/batch_transfer/core/checkpoint_gate.h"
#include "kcenon/batch_transfer/core/countdown_waiter.h"
#include "kcenon/batch_transfer/core/event_channel.h"
#include "kcenon/batch_transfer/core/file_list.h"
#include "kcenon/batch_transfer/core/logging.h"

// Sessions
#include "kcenon/batch_transfer/session/remote_session.h"
#if BATCH_TRANSFER_HAS_SFTP
#include "kcenon/batch_transfer/session/sftp_session.h"
#endif

// Orchestration
#include "kcenon/batch_transfer/orchestrator/transfer_orchestrator.h"
#include "kcenon/batch_transfer/orchestrator/batch_controller.h"

// Profiles
#include "kcenon/batch_transfer/profile/profile_store.h"

// Adapters
#include "kcenon/batch_transfer/adapters/thread_pool_adapter.h"

namespace kcenon::batch_transfer {

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

}  // namespace kcenon::batch_transfer

#endif  // KCENON_BATCH_TRANSFER_BATCH_TRANSFER_H
