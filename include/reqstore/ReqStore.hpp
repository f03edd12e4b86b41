#pragma once

#include "core/Error.hpp"
#include "config/Options.hpp"
#include "config/DataPaths.hpp"
#include "tree/RequestMethod.hpp"
#include "tree/Node.hpp"
#include "tree/CollectionTree.hpp"
#include "store/RequestUpdate.hpp"
#include "store/CollectionStore.hpp"
#include "codec/CollectionCodec.hpp"
#include "persist/CollectionLayout.hpp"
#include "persist/CollectionLoader.hpp"
#include "persist/CollectionCatalog.hpp"
#include "sync/FlushWorker.hpp"
#include "sync/CollectionSynchronizer.hpp"
#include "app/Workspace.hpp"
