/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "da/validation/chunk_validator.hpp"

#include <memory>
#include <shared_mutex>

#include "da/validation/chunk_validation_error.hpp"
#include "log/logger.hpp"

namespace danode::da {
  class AssignmentCoordinator;
  class Encoder;
}  // namespace danode::da

namespace danode::da {

  class ChunkValidatorImpl final : public ChunkValidator {
   public:
    ChunkValidatorImpl(std::shared_ptr<Encoder> encoder,
                       std::shared_ptr<AssignmentCoordinator> assignment,
                       const OperatorId &operator_id);

    outcome::result<void> validateBlob(
        const BlobMessage &blob, const OperatorState &state) const override;

    void updateOperatorId(const OperatorId &operator_id) override;

    OperatorId operatorId() const;

   private:
    outcome::result<void> validateQuorum(const BlobMessage &blob,
                                         const OperatorState &state,
                                         const QuorumHeader &header,
                                         const OperatorId &operator_id) const;

    std::shared_ptr<Encoder> encoder_;
    std::shared_ptr<AssignmentCoordinator> assignment_;

    mutable std::shared_mutex operator_id_mutex_;
    OperatorId operator_id_;

    log::Logger log_;
  };

}  // namespace danode::da
