/**
 * @file benchmark_common.hpp
 * @brief Classes shared by the PropSync copy benchmarks
 */

#ifndef BENCHMARK_COMMON_HPP
#define BENCHMARK_COMMON_HPP

#include "PropSync/ObservableCollections.hpp"

#include <memory>
#include <string>
#include <vector>

// ============================================================================
// Benchmark Classes
// ============================================================================

struct Vector3 {
    float x = 0.0f, y = 0.0f, z = 0.0f;
};

class SimpleClass {
public:
    int intValue = 0;
    float floatValue = 0.0f;
    std::string stringValue;
};

class ComplexClass {
public:
    int id = 0;
    std::string name;
    Vector3 position;
    std::vector<int> scores;
    std::shared_ptr<propsync::ObservableList<std::string>> tags;

    const std::string& getName() const { return name; }
    void setName(const std::string& n) { name = n; }
};

class DeepClass {
public:
    int level1 = 0;
    int level2 = 0;
    int level3 = 0;
    int level4 = 0;
    int level5 = 0;
    std::string data;
};

inline ComplexClass make_complex(int id, std::size_t tag_count) {
    ComplexClass obj;
    obj.id = id;
    obj.name = "complex-" + std::to_string(id);
    obj.position = {1.0f, 2.0f, 3.0f};
    obj.scores = {1, 2, 3, 4, 5};
    obj.tags = std::make_shared<propsync::ObservableList<std::string>>();
    for (std::size_t i = 0; i < tag_count; ++i) {
        obj.tags->add("tag" + std::to_string(i));
    }
    return obj;
}

#endif // BENCHMARK_COMMON_HPP
