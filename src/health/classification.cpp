/// @file classification.cpp
/// @brief Built-in classification registries.

#include "lhe/health/classification.hpp"

namespace lhe::health {

HealthClassificationRegistry MakeHealthClassificationRegistry() {
    return HealthClassificationRegistry{"Flesh", "Armour", "Shield"};
}

DamageClassificationRegistry MakeDamageClassificationRegistry() {
    return DamageClassificationRegistry{"Slash", "Impact", "Fire", "Pierce"};
}

HealthClassificationRegistry& HealthClassifications() {
    static HealthClassificationRegistry registry = MakeHealthClassificationRegistry();
    return registry;
}

DamageClassificationRegistry& DamageClassifications() {
    static DamageClassificationRegistry registry = MakeDamageClassificationRegistry();
    return registry;
}

} // namespace lhe::health
