#include "lendflow/collaborators/sanction_document_generator.hpp"

#include "lendflow/domain/money.hpp"
#include "lendflow/safeguard/input_hash.hpp"

#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace lendflow {

namespace {

std::tm toUtc(std::int64_t ms) {
  const std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm tm{};
  gmtime_r(&seconds, &tm);
  return tm;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
SanctionDocumentGenerator::SanctionDocumentGenerator(const ITimeProvider& clock,
                                                     std::string output_dir)
    : clock_(clock), output_dir_(std::move(output_dir)) {}

// -----------------------------------------------------------------------------
// generateDocument(): reference, letter, optional write
// -----------------------------------------------------------------------------
DocumentResult SanctionDocumentGenerator::generateDocument(
    const SanctionRequest& request) {
  const std::int64_t issued_ms = clock_.now_ms();

  DocumentResult result;
  result.document_id =
      makeReference(issued_ms, request.conversation_id, sequence_.next());

  const std::string letter =
      renderLetter(request, result.document_id, issued_ms);

  if (output_dir_.empty()) {
    result.success = true;
    return result;
  }

  const std::string path = output_dir_ + "/" + result.document_id + ".txt";
  std::ofstream out(path);
  if (!out.is_open()) {
    std::cerr << "[SanctionDocumentGenerator] cannot open " << path << "\n";
    result.success = false;
    result.error = "cannot open " + path;
    return result;
  }

  out << letter;
  out.flush();
  if (!out) {
    std::cerr << "[SanctionDocumentGenerator] write failed for " << path
              << "\n";
    result.success = false;
    result.error = "write failed for " + path;
    return result;
  }

  result.success = true;
  result.location = path;
  std::cout << "[SanctionDocumentGenerator] issued " << result.document_id
            << " -> " << path << "\n";
  return result;
}

// -----------------------------------------------------------------------------
// makeReference()
// -----------------------------------------------------------------------------
std::string SanctionDocumentGenerator::makeReference(
    std::int64_t issued_ms, const std::string& conversation_id,
    std::uint64_t sequence) {
  const std::tm tm = toUtc(issued_ms);
  char stamp[16];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d%H%M%S", &tm);

  const std::uint64_t digest =
      fnv1a64(conversation_id + ":" + std::to_string(sequence));
  char suffix[8];
  std::snprintf(suffix, sizeof(suffix), "%06llX",
                static_cast<unsigned long long>(digest & 0xFFFFFFULL));

  return std::string("LF-") + stamp + "-" + suffix;
}

// -----------------------------------------------------------------------------
// renderLetter()
// -----------------------------------------------------------------------------
std::string SanctionDocumentGenerator::renderLetter(
    const SanctionRequest& request, const std::string& reference,
    std::int64_t issued_ms) {
  const std::tm tm = toUtc(issued_ms);
  char date[32];
  std::strftime(date, sizeof(date), "%B %d, %Y", &tm);

  const double total = request.emi * request.tenure_months;

  std::ostringstream out;
  out << "LOAN SANCTION LETTER\n"
      << "====================\n\n"
      << "Sanction ID: " << reference << "\n"
      << "Date: " << date << "\n\n"
      << "Dear " << request.customer_name << ",\n\n"
      << "We are pleased to inform you that your personal loan application "
         "has been APPROVED.\n\n"
      << "LOAN DETAILS\n"
      << "  Customer ID:       " << request.customer_id << "\n"
      << "  Sanctioned Amount: " << domain::formatRupees(request.loan_amount, 2)
      << "\n"
      << "  Interest Rate:     " << request.interest_rate << "% per annum\n"
      << "  Tenure:            " << request.tenure_months << " months\n"
      << "  Monthly EMI:       " << domain::formatRupees(request.emi, 2) << "\n"
      << "  Total Repayment:   " << domain::formatRupees(total, 2) << "\n";
  if (request.purpose) {
    out << "  Purpose:           " << *request.purpose << "\n";
  }
  out << "\nTERMS & CONDITIONS\n"
      << "1. The loan amount will be disbursed to your registered bank "
         "account within 24 hours.\n"
      << "2. EMI will be auto-debited from your account on the 5th of every "
         "month.\n"
      << "3. Prepayment is allowed after 6 EMIs with no prepayment charges.\n"
      << "4. Late payment will attract a penalty of 2% per month on the "
         "overdue amount.\n"
      << "5. This sanction is valid for 30 days from the date of issue.\n\n"
      << "Authorized Signatory\n";
  return out.str();
}

}  // namespace lendflow
