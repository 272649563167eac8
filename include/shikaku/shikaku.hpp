#ifndef SHIKAKU_HPP
#define SHIKAKU_HPP

#include "shikaku/utils/errors.hpp"
#include "shikaku/utils/config.hpp"
#include "shikaku/utils/label_set.hpp"
#include "shikaku/utils/image_processing.hpp"
#include "shikaku/utils/prediction.hpp"
#include "shikaku/inference/schema_adapter.hpp"
#include "shikaku/inference/model_loader.hpp"
#include "shikaku/inference/shikaku_inference.hpp"
#include "shikaku/service/lifecycle.hpp"
#include "shikaku/service/http_server.hpp"

#endif // SHIKAKU_HPP
