#pragma once

namespace pw::db {

// CREATE TABLE / INDEX IF NOT EXISTS for every table pathwatch writes. Safe to run at every start.
void ensureSchema();

}
