#pragma once

#include "RunState.hpp"

#include <string>

// Persists one RunState per instance as JSON so a later process can destroy
// what an earlier one created.
class StateStore {
public:
    explicit StateStore(std::string stateDir);

    RunState Load(const std::string& instanceName) const;

    // An empty state removes the file.
    void Save(const std::string& instanceName, const RunState& state) const;

    std::string PathFor(const std::string& instanceName) const;

    // File name stem for an instance. Names that are not already plain file
    // names are sanitized and get a hash of the original appended, so
    // distinct instances never share a file.
    static std::string FileStem(const std::string& instanceName);

    static std::string Serialize(const RunState& state);
    static RunState Deserialize(const std::string& text);

private:
    std::string stateDir_;
};
