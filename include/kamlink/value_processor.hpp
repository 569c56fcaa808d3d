#pragma once
/**
 * @page kl-value-processor KamLink Value Processor
 * @file value_processor.hpp
 * @brief Combine a fresh meter reading with stored backend values: overwrite, subtract, add.
 *
 * @details
 * PURPOSE
 * -------
 * The meter only knows lifetime totals. What people want on a dashboard is
 * often "usage since the snapshot I took on Jan 1" or "a counter that survives a
 * meter swap". Each processing request says how to get there:
 *
 *   mode        needs                                   result
 *   ---------   -------------------------------------   -----------------------------
 *   Overwrite   reading                                 reading
 *   Subtract    reading, stored[comparison]             reading - stored[comparison]
 *   Add         reading, stored[comparison],            stored[target]
 *               stored[target]                            + (reading - stored[comparison])
 *
 * REQUEST STRINGS
 * ---------------
 * On the command line a request is "target:command:mode[:comparison]", integers
 * in C notation (0x.. accepted), mode 0/1/2:
 *
 *   89:80:0        write Power to device 89
 *   89:80:1:90     write Power minus device 90 to device 89
 *   91:60:2:92     add (Energy minus device 92) onto device 91
 *
 * The comparison id must be present for Subtract and Add and absent for
 * Overwrite. parse_request() and validate() both enforce that, so a request that
 * reaches the arithmetic is always well formed.
 *
 * NUMERICS
 * --------
 * All arithmetic is double precision on the effective value (exponent already
 * applied). Nothing is rounded here; the sink decides its own display precision.
 *
 * COLLABORATOR
 * ------------
 * Stored values come from a FetchValue callback (usually bound to a
 * ValueStore). A failed fetch is reported as ValueUnavailable and not retried
 * here; retry policy, if any, belongs to the store.
 */

#include "kamlink/error.hpp"
#include "kamlink/reading.hpp"
#include "kamlink/value_store.hpp"

#include <functional>
#include <optional>
#include <string>

namespace kamlink {

enum class Mode : uint8_t {
    Overwrite = 0,
    Subtract  = 1,
    Add       = 2
};

const char* mode_name(Mode m);

struct ProcessingRequest {
    int                target_device_id = 0;
    int                command_id       = 0;
    Mode               mode             = Mode::Overwrite;
    std::optional<int> comparison_device_id;

    /// Mode/comparison-id invariant: present iff mode is Subtract or Add.
    bool validate(Error& err) const;

    /// Canonical "target:command:mode[:comparison]" form.
    std::string to_string() const;
};

struct ProcessingResult {
    int    target_device_id = 0;
    double value            = 0.0;
};

/**
 * @brief Parse "target:command:mode[:comparison]".
 * @return false with err=InvalidRequest on a bad shape, bad integer, unknown mode,
 *         or a comparison id that does not match the mode.
 */
bool parse_request(const std::string& text, ProcessingRequest& out, Error& err);

/// Resolves a stored value for a device id; false + err when it cannot.
using FetchValue = std::function<bool(int device_id, double& out, Error& err)>;

class ValueProcessor {
public:
    /**
     * @brief Apply @p req to @p reading.
     *
     * @return false with InvalidRequest (checked before anything is fetched) or
     *         ValueUnavailable (a required stored value could not be fetched).
     */
    static bool process(const ProcessingRequest& req, const Reading& reading,
                        const FetchValue& fetch, ProcessingResult& out, Error& err);

    /// Same, fetching stored values from @p store.
    static bool process(const ProcessingRequest& req, const Reading& reading,
                        ValueStore& store, ProcessingResult& out, Error& err);
};

} // namespace kamlink
