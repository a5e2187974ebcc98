#pragma once
#include <memory>
#include <string>
#include <core/SectionSelector.hpp>

class SelectorFactory {
public:
    static std::unique_ptr<SectionSelector> create(const std::string& name);
};
