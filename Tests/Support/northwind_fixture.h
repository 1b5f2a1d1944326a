#pragma once

#include <QString>

namespace rc::test {

// Builds a miniature Northwind database at dbPath (overwriting it).
//
//   Categories     Beverages, Condiments, Seafood
//   Products       Chai, Chang (Beverages), Aniseed Syrup (Condiments),
//                  Ikura (Seafood)
//   Customers      ALFKI, BOTTM, QUICK
//   Orders         10001..10005 (June 1997 x2, December 1997 x2, July 1996)
//   Order Details  eight lines
//
// Expected answers over this data:
//   Beverages revenue, June 1997            522.0
//   Top category by quantity, June 1997     Beverages / 30
//   AOV, December 1997                      238.0
//   Top 3 products by revenue               Chang 418, Ikura 372, Aniseed Syrup 350
//   Top customer by gross margin, 1997      Bottom-Dollar Markets / 121.2
//   Order count                             5
bool buildNorthwindFixture(const QString& dbPath, QString* errorMessage = nullptr);

} // namespace rc::test
