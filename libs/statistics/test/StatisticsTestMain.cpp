// Copyright (C) triagesim project - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
