#ifndef UREG_HPP
#define UREG_HPP

#include "UnitErrors.hpp"
#include "UnitsContainer.hpp"
#include "UnitDefinition.hpp"
#include "UnitExpression.hpp"
#include "Context.hpp"
#include "UnitRegistry.hpp"
#include "DefaultDefinitions.hpp"
#include "Quantity.hpp"
#include "DimensionalAnalysis.hpp"
#include "ConfigReader.hpp"

#endif // UREG_HPP
