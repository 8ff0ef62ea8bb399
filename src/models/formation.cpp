#include "models/formation.hpp"

namespace pitchside {

auto formations_for(int team_size) -> std::span<const formation>
{
	static const std::vector<formation> four{
			{"1-2-1", {{50, 85}, {25, 55}, {75, 55}, {50, 25}}},
			{"2-1-1", {{35, 85}, {65, 85}, {50, 55}, {50, 25}}},
			{"1-1-2", {{50, 85}, {50, 55}, {35, 25}, {65, 25}}},
	};
	static const std::vector<formation> seven{
			{"2-3-1", {{50, 90}, {30, 70}, {70, 70}, {20, 45}, {50, 45}, {80, 45}, {50, 20}}},
			{"3-2-1", {{50, 90}, {25, 70}, {50, 70}, {75, 70}, {35, 40}, {65, 40}, {50, 15}}},
			{"2-2-2", {{50, 90}, {30, 70}, {70, 70}, {30, 40}, {70, 40}, {35, 15}, {65, 15}}},
	};
	static const std::vector<formation> nine{
			{"3-3-2", {{50, 90}, {25, 72}, {50, 72}, {75, 72}, {25, 48}, {50, 48}, {75, 48}, {35, 20}, {65, 20}}},
			{"3-2-3", {{50, 90}, {25, 72}, {50, 72}, {75, 72}, {35, 48}, {65, 48}, {25, 20}, {50, 20}, {75, 20}}},
			{"2-4-2", {{50, 90}, {30, 72}, {70, 72}, {20, 48}, {40, 48}, {60, 48}, {80, 48}, {35, 20}, {65, 20}}},
	};
	static const std::vector<formation> eleven{
			{"4-4-2", {{50, 92}, {20, 75}, {40, 75}, {60, 75}, {80, 75}, {20, 50}, {40, 50}, {60, 50}, {80, 50}, {35, 22}, {65, 22}}},
			{"4-3-3", {{50, 92}, {20, 75}, {40, 75}, {60, 75}, {80, 75}, {30, 50}, {50, 50}, {70, 50}, {25, 22}, {50, 22}, {75, 22}}},
			{"3-5-2", {{50, 92}, {25, 75}, {50, 75}, {75, 75}, {15, 50}, {35, 50}, {50, 50}, {65, 50}, {85, 50}, {35, 22}, {65, 22}}},
			{"4-2-3-1", {{50, 92}, {20, 75}, {40, 75}, {60, 75}, {80, 75}, {35, 55}, {65, 55}, {25, 35}, {50, 35}, {75, 35}, {50, 15}}},
	};

	switch (team_size) {
	case 4:
		return four;
	case 7:
		return seven;
	case 9:
		return nine;
	case 11:
		return eleven;
	default:
		return {};
	}
}

} // namespace pitchside
