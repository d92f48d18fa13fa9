#pragma once

namespace gp::database {

class Transactions;

void initSchema(const Transactions& tx);

}
