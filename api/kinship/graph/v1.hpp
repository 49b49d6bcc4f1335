#pragma once

#include "kinship/graph/v1/types.pb.h"
#include "kinship/graph/v1/relatives.pb.h"
#include "kinship/graph/v1/lineage_path.pb.h"
#include "kinship/graph/v1/partner_match.pb.h"
