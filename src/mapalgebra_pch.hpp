#pragma once
#ifndef ma_mapalgebra_pch_h
#define ma_mapalgebra_pch_h

#include<algorithm>
#include<cmath>
#include<cstdint>
#include<functional>
#include<limits>
#include<memory>
#include<mutex>
#include<stdexcept>
#include<string>
#include<type_traits>
#include<utility>
#include<vector>

#include<gdal_priv.h>
#include<cpl_conv.h>
#include<cpl_error.h>
#include<cpl_string.h>

#include<xtl/xoptional.hpp>

#include<spdlog/spdlog.h>

#endif
