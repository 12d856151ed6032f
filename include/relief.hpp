#pragma once

#include "relief/relief.hpp"
