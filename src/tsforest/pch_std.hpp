#pragma once

// STD C LIB
#include <cassert>
#include <cmath>
#include <cstddef>
#include <cstdlib>

// STD C++ LIB
#include <algorithm>
#include <atomic>
#include <chrono>
#include <concepts>
#include <exception>
#include <functional>
#include <iostream>
#include <iomanip>
#include <limits>
#include <memory>
#include <map>
#include <mutex>
#include <numeric>
#include <optional>
#include <queue>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>
