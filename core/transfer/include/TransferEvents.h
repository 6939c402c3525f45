#pragma once

/**
 * @file TransferEvents.h
 * @brief EventBus topics published by TransferSender and TransferReceiver
 *
 * Payload types (std::any):
 *   PROGRESS     ProgressUpdate
 *   STATUS       std::string
 *   STATE        SenderState or ReceiverState
 *   FINGERPRINT  std::string
 *   COMPLETE     TransferSummary
 *   FAILED       Error
 */

namespace PeerBeam::events {

constexpr const char* PROGRESS = "transfer.progress";
constexpr const char* STATUS = "transfer.status";
constexpr const char* STATE = "transfer.state";
constexpr const char* FINGERPRINT = "transfer.fingerprint";
constexpr const char* COMPLETE = "transfer.complete";
constexpr const char* FAILED = "transfer.failed";

} // namespace PeerBeam::events
