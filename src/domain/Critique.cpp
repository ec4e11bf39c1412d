/**
 * @file Critique.cpp
 * @brief Implementation of Suggestion helpers.
 */

#include "domain/Critique.hpp"
#include "domain/TextUtils.hpp"

namespace draftlens::domain {

bool Suggestion::isAppliable() const {
    return !TextUtils::IsBlank(replacementText);
}

} // namespace draftlens::domain
