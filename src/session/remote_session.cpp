/**
 * @file remote_session.cpp
 * @brief Session helpers shared by every connector
 */

#include "kcenon/batch_transfer/session/remote_session.h"

#include "kcenon/batch_transfer/core/logging.h"

namespace kcenon::batch_transfer {

auto probe_connection(session_connector& connector, const session_options& options)
    -> result<std::string> {
    batch_log_context ctx;
    ctx.server_address = options.endpoint_string();
    BT_LOG_INFO_CTX(log_category::session, "Probing connection", ctx);

    auto session = connector.connect(options);
    if (!session.has_value()) {
        ctx.error_message = session.error().message;
        BT_LOG_WARN_CTX(log_category::session, "Probe connect failed", ctx);
        return unexpected{session.error()};
    }

    auto home = session.value()->home_directory();

    auto closed = session.value()->close();
    if (!closed.has_value()) {
        BT_LOG_DEBUG(log_category::session,
                     "Ignoring close error after probe: " + closed.error().message);
    }

    if (!home.has_value()) {
        ctx.error_message = home.error().message;
        BT_LOG_WARN_CTX(log_category::session, "Probe could not resolve remote home", ctx);
        return unexpected{home.error()};
    }
    return home.value();
}

}  // namespace kcenon::batch_transfer
