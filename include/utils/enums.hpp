#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

// Rule deciding when a section leaves the pool of eligible sections.
// Values are stored in the state file.
enum class TraversalMode : uint8_t {
	Budget = 1,   // retired after emitting all of its values
	Rounds = 2    // retired when picked, until every section was picked once
};

inline std::string toString(TraversalMode mode) {
	switch (mode) {
	case TraversalMode::Budget: return "budget";
	case TraversalMode::Rounds: return "rounds";
	}
	return "unknown";
}

inline TraversalMode traversalFromString(const std::string& name) {
	if (name == "budget") return TraversalMode::Budget;
	if (name == "rounds") return TraversalMode::Rounds;
	throw std::runtime_error("Unknown traversal: " + name + ". Use 'budget' or 'rounds'");
}
