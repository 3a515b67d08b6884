/**
 * @file IShredService.hpp
 * @brief Interface for submitting and observing secure-erasure requests
 */

#pragma once

#include "models/ShredTypes.hpp"
#include "services/EventStream.hpp"
#include "util/Error.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <vector>

/**
 * @class IShredService
 * @brief Abstract interface for file, tree and free-space destruction
 *
 * Requests run asynchronously; their outcome is observed through
 * subscribe() or waited for with wait().
 */
class IShredService {
public:
    virtual ~IShredService() = default;

    /**
     * @brief Plan and start destroying @p targets
     * @param targets Files, or directories when options.recursive is set
     * @param options Pattern, chunking, concurrency and verification options
     * @return Request id, or an error if the options themselves are invalid
     *
     * Targets that are denied, locked, missing or unsupported do not reject
     * the request; each produces a SKIPPED result instead.
     */
    virtual auto submit(const std::vector<std::filesystem::path>& targets,
                        const ShredOptions& options) -> std::expected<RequestId, util::Error> = 0;

    /**
     * @brief Events of a request, replayed from the first one
     * @return std::nullopt for an unknown request
     */
    [[nodiscard]] virtual auto subscribe(RequestId request) -> std::optional<EventStream> = 0;

    /**
     * @brief Ask every task of @p request to stop at its next chunk boundary
     * @return false if the request is unknown or already finished
     */
    virtual auto cancel(RequestId request) -> bool = 0;

    /**
     * @brief Overwrite the free space of the volume holding @p volume_root
     */
    virtual auto wipe_free_space(const std::filesystem::path& volume_root,
                                 const ShredOptions& options)
        -> std::expected<RequestId, util::Error> = 0;

    /**
     * @brief Block until every task of @p request is terminal
     * @return false for an unknown request
     */
    virtual auto wait(RequestId request) -> bool = 0;

    /**
     * @brief Forget a finished request and its event log
     * @return false if the request is unknown or still running
     *
     * Streams obtained earlier keep working; later subscribe() calls fail.
     */
    virtual auto release(RequestId request) -> bool = 0;
};
