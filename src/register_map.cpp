#include "register_map.hpp"
#include <algorithm>
#include <iostream>
#include <map>

RegisterMap::RegisterMap(const std::vector<SlaveDevice>& devices, const std::vector<RegisterMapping>& mappings) {
    // --- 1. Active devices, ascending by address ---
    std::map<int, SlaveDevice> active;
    for (const auto& device : devices) {
        if (!device.active) continue;
        if (!active.emplace(device.address, device).second) {
            std::cerr << "Warning: duplicate slave address " << device.address << " ignored" << std::endl;
        }
    }

    // --- 2. Group mappings into (slave -> (register, fc) -> mappings) ---
    std::map<int, std::map<std::pair<int, int>, std::vector<RegisterMapping>>> grouped;
    for (const auto& mapping : mappings) {
        if (active.find(mapping.slave_address) == active.end()) {
            std::cerr << "Warning: mapping " << mapping.mapping_id << " targets inactive or unknown slave "
                      << mapping.slave_address << ", not polled" << std::endl;
            continue;
        }
        if (!by_id.emplace(mapping.mapping_id, mapping).second) {
            std::cerr << "Warning: duplicate mapping id " << mapping.mapping_id << " ignored" << std::endl;
            continue;
        }
        auto& bucket = grouped[mapping.slave_address][{mapping.register_address, mapping.function_code}];
        if (!bucket.empty()) {
            std::cout << "Register " << mapping.register_address << " of slave " << mapping.slave_address
                      << " shared by mappings " << bucket.front().mapping_id << " and " << mapping.mapping_id
                      << "; read once per cycle" << std::endl;
        }
        bucket.push_back(mapping);
    }

    // --- 3. Flatten into the poll plan ---
    for (const auto& entry : active) {
        DevicePlan plan;
        plan.device = entry.second;
        auto it = grouped.find(entry.first);
        if (it != grouped.end()) {
            for (auto& point_entry : it->second) {
                RegisterPoint point;
                point.register_address = point_entry.first.first;
                point.function_code = point_entry.first.second;
                point.mappings = point_entry.second;
                std::sort(point.mappings.begin(), point.mappings.end(),
                          [](const RegisterMapping& a, const RegisterMapping& b) {
                              return a.mapping_id < b.mapping_id;
                          });
                plan.points.push_back(std::move(point));
            }
        }
        device_plans.push_back(std::move(plan));
    }
}

std::optional<RegisterMapping> RegisterMap::findMapping(int mapping_id) const {
    auto it = by_id.find(mapping_id);
    if (it != by_id.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<RegisterMapping> RegisterMap::mappingsForEntity(EntityKind kind, int entity_id) const {
    std::vector<RegisterMapping> result;
    for (const auto& entry : by_id) {
        if (entry.second.entity_kind == kind && entry.second.entity_id == entity_id) {
            result.push_back(entry.second);
        }
    }
    std::sort(result.begin(), result.end(), [](const RegisterMapping& a, const RegisterMapping& b) {
        return a.mapping_id < b.mapping_id;
    });
    return result;
}

std::vector<RegisterMapping> RegisterMap::mappingsAt(int slave_address, int register_address) const {
    std::vector<RegisterMapping> result;
    for (const auto& plan : device_plans) {
        if (plan.device.address != slave_address) continue;
        for (const auto& point : plan.points) {
            if (point.register_address == register_address) {
                result.insert(result.end(), point.mappings.begin(), point.mappings.end());
            }
        }
    }
    return result;
}
