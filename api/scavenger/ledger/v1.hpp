#pragma once

#include "scavenger/ledger/v1/types.pb.h"

/*
  Public record types of the ledger engine.

  WasteUnit, TransferRecord and IncentiveProgram are what the engine hands
  back to its host; storage rows live in internal/db/model.
*/
