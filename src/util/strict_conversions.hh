/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef STRICT_CONVERSIONS_HH
#define STRICT_CONVERSIONS_HH

#include <string>

unsigned long int strict_atoui(const std::string & str, const int base = 10);
std::string double_to_string(const double input, const int precision);

#endif /* STRICT_CONVERSIONS_HH */
