#include "contentflow/drain.hpp"

#include <memory>

#include "contentflow/content-source.hpp"

namespace contentflow::internal {

void AwaitDemand(ContentSource& source) {
  // shared: the continuation may still be running on the notifying thread when wait() returns
  auto waiter = std::make_shared<DemandWaiter>();
  source.demand([waiter] { waiter->notify(); });
  waiter->wait();
}

}  // namespace contentflow::internal
