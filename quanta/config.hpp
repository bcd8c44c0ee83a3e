/*
 * config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-4-10

Description: Build-time configuration of the exact arithmetic and unit
conversion layers

**************************************************/

#ifndef QUANTA_CONFIG_HPP
#define QUANTA_CONFIG_HPP

// Fractional digits generated by the decimal formatter before rounding
#ifndef QUANTA_DECIMAL_MAX_DIGITS
#define QUANTA_DECIMAL_MAX_DIGITS 24
#endif

// Largest |exponent - fraction digits| the parser turns into a power of ten;
// 0 accepts any scale
#ifndef QUANTA_MAX_DECIMAL_EXPONENT
#define QUANTA_MAX_DECIMAL_EXPONENT 0
#endif

// Catalog read by the example program when no path is given
#ifndef QUANTA_DEFAULT_UNITS_MAP
#define QUANTA_DEFAULT_UNITS_MAP "units.ucum.json"
#endif

#endif  // QUANTA_CONFIG_HPP
