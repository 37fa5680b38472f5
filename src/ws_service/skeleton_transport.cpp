#include <posecast/transport/skeleton_transport.hpp>
#include <posecast/transport/udp_transport.hpp>
#include <posecast/transport/ws_transport.hpp>

namespace posecast {

std::unique_ptr<SkeletonTransport> makeTransport(const CaptureConfig& cfg) {
    switch (cfg.transportKind()) {
        case TransportKind::WEBSOCKET:
            return std::make_unique<WsTransport>(parseWebSocketEndpoint(cfg.endpoint));
        case TransportKind::UDP:
            return std::make_unique<UdpTransport>(parseUdpEndpoint(cfg.endpoint));
    }
    return nullptr;
}

} // namespace posecast
