/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "parachain/validator/statement_distribution/statement_distribution_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attesta::parachain::statement_distribution,
                            KnowledgeStoreError,
                            e) {
  using E = attesta::parachain::statement_distribution::KnowledgeStoreError;
  switch (e) {
    case E::UNKNOWN_CANDIDATE:
      return "Candidate is not registered at this relay parent";
    case E::VALIDATOR_NOT_IN_GROUP:
      return "Validator is not in the candidate's backing group";
  }
  return "Unknown knowledge store error";
}

OUTCOME_CPP_DEFINE_CATEGORY(attesta::parachain::statement_distribution,
                            StatementDistributionError,
                            e) {
  using E =
      attesta::parachain::statement_distribution::StatementDistributionError;
  switch (e) {
    case E::UNKNOWN_RELAY_PARENT:
      return "Relay parent is not active";
    case E::UNKNOWN_CANDIDATE:
      return "Unknown candidate";
    case E::CANDIDATE_NOT_CONFIRMED:
      return "Candidate receipt is not known yet";
    case E::INVALID_MASK_LENGTH:
      return "Statement mask does not match the group size";
    case E::REQUEST_ALREADY_OUTSTANDING:
      return "Request to this peer for this candidate is in flight";
    case E::PEER_NOT_IN_VIEW:
      return "Peer does not have the relay parent in view";
    case E::KNOWLEDGE_COMPLETE:
      return "All statements of the candidate are already known";
    case E::RESPONSE_DECODE_FAILED:
      return "Attested candidate response could not be decoded";
    case E::CANDIDATE_HASH_MISMATCH:
      return "Receipt does not hash to the requested candidate";
    case E::PVD_HASH_MISMATCH:
      return "Persisted validation data does not match the descriptor";
    case E::RELAY_PARENT_MISMATCH:
      return "Receipt relay parent differs from the requested one";
  }
  return "Unknown statement-distribution error";
}
