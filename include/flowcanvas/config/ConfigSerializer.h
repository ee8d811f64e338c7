#pragma once

#include "flowcanvas/config/CanvasOptions.h"

#include <string>

namespace flowcanvas {

/// JSON serialization and file I/O for CanvasOptions
///
/// Every section and key is optional on input; anything missing keeps its
/// default value.
class ConfigSerializer {
public:
    /// Serialize options to a JSON string
    static std::string toJson(const CanvasOptions& options);

    /// Parse options from a JSON string
    /// @param options Populated in place; untouched when parsing fails
    /// @return true if parsing succeeded
    static bool fromJson(CanvasOptions& options, const std::string& json);

    /// Save options to file
    /// @return true if save succeeded
    static bool saveToFile(const CanvasOptions& options, const std::string& path);

    /// Load options from file
    /// @return true if load succeeded
    static bool loadFromFile(CanvasOptions& options, const std::string& path);

private:
    static std::string routingAlgorithmToString(RoutingAlgorithm algorithm);
    static RoutingAlgorithm stringToRoutingAlgorithm(const std::string& str);
};

}  // namespace flowcanvas
