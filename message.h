#pragma once

#include <string>
#include <vector>
#include <iostream>

/// @brief A single provider-neutral chat message
/// Ordered sequences of these form one conversation turn
struct Message {
	enum Role {
		SYSTEM,     // System prompt (hoisted out-of-band by some backends)
		USER,       // User input
		ASSISTANT   // Provider responses
	};

	Role role;
	std::string content;

	Message(Role r, const std::string& c) : role(r), content(c) {}

	// Convert role string to Role enum
	static Role stringToRole(const std::string& roleStr) {
		if (roleStr == "system") return SYSTEM;
		if (roleStr == "user") return USER;
		if (roleStr == "assistant") return ASSISTANT;
		return USER;  // Default fallback
	}

	// Wire name of the role ("system", "user", "assistant")
	std::string get_role() const {
		switch (role) {
			case SYSTEM: return "system";
			case USER: return "user";
			case ASSISTANT: return "assistant";
			default: return "user";
		}
	}

	bool operator==(const Message& other) const {
		return role == other.role && content == other.content;
	}
};

using MessageList = std::vector<Message>;

inline std::ostream& operator<<(std::ostream& os, const Message& msg) {
	os << msg.get_role() << ": ";
	if (msg.content.length() > 100) {
		os << msg.content.substr(0, 100) << "...";
	} else {
		os << msg.content;
	}
	return os;
}
