#pragma once
#include "ScanTypes.hpp"
#include <nlohmann/json.hpp>

void to_json(nlohmann::json& j, const Match& m);
void to_json(nlohmann::json& j, const Verdict& v);
void to_json(nlohmann::json& j, const PatternCounts& c);
void to_json(nlohmann::json& j, const EngineStats& s);
