#pragma once

#include <QtCore/QJsonObject>
#include <optional>

#include "../core/common/StreamError.hpp"
#include "../core/media/TranscodePool.hpp"
#include "../core/storage/CatalogStore.hpp"
#include "../core/streaming/WatcherRegistry.hpp"
#include "../core/torrent/SwarmTypes.hpp"

namespace Swarmcast {

namespace JsonViews {

/// {"error", "message", "retryable"}
QJsonObject error(StreamError error);

/**
 * @brief Metadata reply; catalog name and poster win when present
 *
 * Each file carries its filename-based classification.
 */
QJsonObject metadata(const TorrentMetadata& metadata, const std::optional<CatalogEntry>& catalogEntry);

QJsonObject swarmStats(const SwarmStats& stats);
QJsonObject registry(const RegistryDebugInfo& info);
QJsonObject transcodePool(const TranscodePoolStats& stats);

QJsonObject health(const DhtStatus& dht, const QList<SwarmStats>& swarms,
                   const RegistryDebugInfo& registryInfo, const TranscodePoolStats& poolStats);

} // namespace JsonViews

} // namespace Swarmcast
