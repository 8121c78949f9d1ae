#pragma once

#include "graphvc/v1/object.pb.h"
#include "graphvc/v1/branch.pb.h"
#include "graphvc/v1/merge.pb.h"
