#ifndef PCH_H
#define PCH_H

#include "gtest/gtest.h"

#endif // PCH_H
