#pragma once

#ifdef PC_BRIDGE_VERBOSE
#include <iostream>

#define PC_BRIDGE_LOG(expr) (std::cerr << "[pc_bridge] " << expr << '\n')
#else
#define PC_BRIDGE_LOG(expr) ((void)0)
#endif
