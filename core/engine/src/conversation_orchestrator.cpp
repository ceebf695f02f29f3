#include "lendflow/engine/conversation_orchestrator.hpp"

#include "lendflow/domain/money.hpp"
#include "lendflow/intent/text_parsers.hpp"
#include "lendflow/safeguard/input_hash.hpp"

#include <iostream>
#include <sstream>
#include <utility>
#include <variant>

namespace lendflow {

namespace {

constexpr const char* kBrand = "LendFlow Personal Loans";

// 12.5 -> "12.5", 11 -> "11".
std::string formatRate(double rate) {
  std::ostringstream out;
  out << rate;
  return out.str();
}

void appendParagraph(std::string& reply, const std::string& text) {
  if (text.empty()) {
    return;
  }
  if (!reply.empty()) {
    reply += "\n\n";
  }
  reply += text;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ConversationOrchestrator::ConversationOrchestrator(
    std::string conversation_id, Collaborators collaborators,
    domain::ConversationPolicy conversation_policy,
    domain::UnderwritingPolicy underwriting_policy, const ITimeProvider& clock,
    EventBus* bus)
    : state_(std::move(conversation_id), conversation_policy.max_agent_calls),
      collaborators_(collaborators),
      policy_(std::move(conversation_policy)),
      engine_(underwriting_policy),
      clock_(clock),
      bus_(bus) {}

// -----------------------------------------------------------------------------
// processMessage(): run handlers until a suspend point
// -----------------------------------------------------------------------------
TurnReply ConversationOrchestrator::processMessage(const std::string& text) {
  if (state_.isTerminal()) {
    return TurnReply{handleEnd().text, domain::toDisplayJson(state_)};
  }

  if (text.size() > policy_.max_message_chars) {
    std::cerr << "[ConversationOrchestrator] conversation="
              << state_.conversation_id << " message of " << text.size()
              << " chars exceeds limit " << policy_.max_message_chars << '\n';
    state_.addMessage(domain::Speaker::Customer,
                      text.substr(0, policy_.max_message_chars));
    std::string reply =
        "That message is too long for me to read. Could you send it again "
        "in under " +
        std::to_string(policy_.max_message_chars) + " characters?";
    state_.addMessage(domain::Speaker::Assistant, reply);
    return TurnReply{std::move(reply), domain::toDisplayJson(state_)};
  }

  state_.addMessage(domain::Speaker::Customer, text);

  std::string reply;
  if (state_.call_guard.budgetExhausted()) {
    reply = safeguardDrop("", GuardVerdict::BudgetExhausted).text;
  } else {
    for (int hop = 0; hop < kMaxStagesPerTurn; ++hop) {
      const domain::Stage before = state_.stage;

      StageStep step;
      try {
        step = dispatch(text);
      } catch (const std::exception& e) {
        step = collaboratorFault(e);
      }
      appendParagraph(reply, step.text);

      if (step.yield || state_.isTerminal() || state_.stage == before ||
          !policy_.autoContinues(state_.stage)) {
        break;
      }
    }
  }

  state_.addMessage(domain::Speaker::Assistant, reply);
  return TurnReply{std::move(reply), domain::toDisplayJson(state_)};
}

// -----------------------------------------------------------------------------
// dispatch(): stage -> handler
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep ConversationOrchestrator::dispatch(
    const std::string& message) {
  using domain::Stage;
  switch (state_.stage) {
    case Stage::Intro:              return handleIntro(message);
    case Stage::NeedDiscovery:      return handleNeedDiscovery(message);
    case Stage::OfferPresentation:  return handleOfferPresentation(message);
    case Stage::KycVerification:    return handleKycVerification();
    case Stage::Underwriting:       return handleUnderwriting();
    case Stage::DocumentCollection: return handleDocumentCollection(message);
    case Stage::Sanction:           return handleSanction();
    case Stage::Rejection:          return handleRejection();
    case Stage::End:                return handleEnd();
  }
  return handleEnd();
}

// -----------------------------------------------------------------------------
// INTRO
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep ConversationOrchestrator::handleIntro(
    const std::string& message) {
  if (auto phone = extractPhoneNumber(message)) {
    state_.phone = *phone;
    transitionTo(domain::Stage::NeedDiscovery);
    if (policy_.autoContinues(domain::Stage::NeedDiscovery)) {
      return {};
    }
    return {"Thank you! Let me look up your pre-approved offer.", true};
  }

  transitionTo(domain::Stage::NeedDiscovery);
  return {std::string("Hello! Welcome to ") + kBrand +
              ". I'm here to help you with a quick and easy loan today.\n\n"
              "May I know your **mobile number** so I can check if you have "
              "a pre-approved offer waiting for you?",
          true};
}

// -----------------------------------------------------------------------------
// NEED_DISCOVERY: phone -> offer lookup (not counted)
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::handleNeedDiscovery(const std::string& message) {
  if (!state_.phone) {
    auto phone = extractPhoneNumber(message);
    if (!phone) {
      return {"I didn't catch your mobile number. Could you please share "
              "your **10-digit mobile number**?",
              true};
    }
    state_.phone = *phone;
  }

  LookupResult result = collaborators_.lookup.lookup(*state_.phone);
  if (!result.found()) {
    std::string reason = result.not_found_reason.empty()
                             ? "No customer record found for this phone number"
                             : result.not_found_reason;
    return finish(domain::TerminalState::CustomerDropped,
                  std::string("I'm sorry, but I couldn't find your profile in "
                              "our system. You may need to register with us "
                              "first. Thank you for your interest in ") +
                      kBrand + "!",
                  std::move(reason));
  }

  const domain::CustomerRecord& customer = *result.customer;
  state_.customer_id = customer.customer_id;
  state_.customer_name = customer.name;
  state_.credit_score = customer.credit_score;

  const auto& uw = engine_.policy();
  if (customer.credit_score < uw.min_credit_score) {
    state_.rejection_reason =
        "Credit score (" + std::to_string(customer.credit_score) + "/" +
        std::to_string(uw.max_credit_score) +
        ") is below minimum requirement (" +
        std::to_string(uw.min_credit_score) + ")";
    return finish(domain::TerminalState::LoanRejected,
                  std::string("I'm sorry, but I wasn't able to find a "
                              "pre-approved offer for you at this time. Our "
                              "loan products require a minimum credit score. "
                              "You may want to work on improving your credit "
                              "score and try again in a few months. Thank you "
                              "for your interest in ") +
                      kBrand + "!",
                  state_.rejection_reason);
  }

  if (!result.hasUsableOffer()) {
    state_.rejection_reason =
        "No pre-approved offer is available for this customer";
    return finish(domain::TerminalState::LoanRejected,
                  std::string("I'm sorry, but there is no pre-approved offer "
                              "on your profile right now. Thank you for your "
                              "interest in ") +
                      kBrand + "!",
                  state_.rejection_reason);
  }

  const domain::PreapprovedOffer& offer = *customer.offer;
  state_.preapproved_limit = offer.limit;
  state_.interest_rate = offer.interest_rate;
  state_.max_tenure_months = offer.max_tenure_months;

  transitionTo(domain::Stage::OfferPresentation);

  const std::string limit = domain::formatRupees(offer.limit);
  return {"Great news, **" + customer.name + "**!\n\n"
              "You have a **pre-approved personal loan offer** of up to **" +
              limit + "**!\n\n"
              "**Your Offer Details:**\n"
              "- Maximum Amount: " + limit + "\n"
              "- Interest Rate: " + formatRate(offer.interest_rate) +
              "% per annum\n"
              "- Maximum Tenure: " + std::to_string(offer.max_tenure_months) +
              " months\n\n"
              "How much would you like to borrow, and for how many months?",
          true};
}

// -----------------------------------------------------------------------------
// OFFER_PRESENTATION: decline check, then field extraction
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::handleOfferPresentation(const std::string& message) {
  Intent intent = classifier_.classify(ReplyContext::OfferResponse, message);
  if (const auto* decline = std::get_if<Decline>(&intent)) {
    return finish(domain::TerminalState::CustomerDropped,
                  std::string("I understand. Thank you for considering ") +
                      kBrand +
                      ". If you change your mind, our pre-approved offer will "
                      "be available for 30 days. Have a great day!",
                  "customer declined the offer (\"" + decline->matched_phrase +
                      "\")");
  }

  const auto* extractable = std::get_if<Extractable>(&intent);
  const std::string& text = extractable ? extractable->text : message;

  if (auto refused = admit(kFieldExtractor, {{"message", text}})) {
    return *refused;
  }

  ExtractedFields fields = collaborators_.extractor.extractFields(
      text, state_.recentMessages(policy_.extraction_context_messages));

  if (fields.requested_amount && *fields.requested_amount > 0.0) {
    state_.requested_amount = fields.requested_amount;
  }
  if (fields.tenure_months && *fields.tenure_months > 0) {
    state_.tenure_months = fields.tenure_months;
  }
  if (fields.purpose) {
    state_.purpose = fields.purpose;
  }

  if (!state_.requested_amount) {
    return {"What **amount** would you like to borrow? Please specify in "
            "rupees.",
            true};
  }

  const std::string amount = domain::formatRupees(*state_.requested_amount);
  if (!state_.tenure_months) {
    return {"Got it, " + amount +
                ". For **how many months** would you like the loan?",
            true};
  }

  transitionTo(domain::Stage::KycVerification);
  return {"Perfect! You want **" + amount + "** for **" +
              std::to_string(*state_.tenure_months) +
              " months**.\n\nLet me verify your details and process this "
              "request...",
          false};
}

// -----------------------------------------------------------------------------
// KYC_VERIFICATION
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::handleKycVerification() {
  const std::string phone = state_.phone.value();
  if (auto refused = admit(kKycLookup, {{"phone", phone}})) {
    return *refused;
  }

  LookupResult result = collaborators_.lookup.lookup(phone);

  if (!result.found() || !result.kycVerified()) {
    std::string reason;
    if (!result.found()) {
      reason = result.not_found_reason.empty()
                   ? "No customer record found for this phone number"
                   : result.not_found_reason;
    } else {
      reason = "KYC verification pending. Please complete KYC first.";
    }
    state_.rejection_reason = reason;
    return finish(domain::TerminalState::LoanRejected,
                  "I'm sorry, but we couldn't verify your details. " + reason +
                      "\n\nPlease ensure your KYC is complete and try again. "
                      "Thank you!",
                  reason);
  }

  const domain::CustomerRecord& customer = *result.customer;
  state_.kyc_verified = true;
  if (!customer.pan_number.empty()) {
    state_.pan_number = customer.pan_number;
  }
  if (customer.monthly_salary > 0.0 && !state_.salary_slip_received) {
    state_.salary = customer.monthly_salary;
  }
  if (!customer.employer.empty()) {
    state_.employer = customer.employer;
  }

  transitionTo(domain::Stage::Underwriting);
  return {"Your KYC details are verified.", false};
}

// -----------------------------------------------------------------------------
// UNDERWRITING
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::handleUnderwriting() {
  UnderwritingRequest request;
  request.requested_amount = state_.requested_amount.value();
  request.tenure_months = state_.tenure_months.value();
  request.preapproved_limit = state_.preapproved_limit.value();
  request.credit_score = state_.credit_score.value();
  request.interest_rate = state_.interest_rate.value();
  if (state_.salary_slip_received) {
    request.salary = state_.salary;
  }

  nlohmann::json inputs = {
      {"requested_amount", request.requested_amount},
      {"tenure_months", request.tenure_months},
      {"preapproved_limit", request.preapproved_limit},
      {"credit_score", request.credit_score},
      {"interest_rate", request.interest_rate},
      {"salary", nullptr},
  };
  if (request.salary) {
    inputs["salary"] = *request.salary;
  }

  if (auto refused = admit(kEligibilityEngine, inputs)) {
    return *refused;
  }

  UnderwritingResult result = engine_.decide(request);

  state_.decision = result.decision;
  state_.emi = result.emi;
  state_.suggested_amount = result.suggested_amount;

  publish(UnderwritingDecisionEvent{state_.conversation_id, result.decision,
                                    request.requested_amount, result.emi,
                                    result.reason, now(), nextSequence()});

  std::cout << "[ConversationOrchestrator] conversation="
            << state_.conversation_id
            << " decision=" << domain::toString(result.decision) << " ("
            << result.reason << ")\n";

  switch (result.decision) {
    case domain::Decision::Approved:
      state_.rejection_reason.reset();
      transitionTo(domain::Stage::Sanction);
      return {};

    case domain::Decision::NeedSalarySlip:
      transitionTo(domain::Stage::DocumentCollection);
      return {"Almost there! Your requested amount of **" +
                  domain::formatRupees(request.requested_amount) +
                  "** exceeds your pre-approved limit of " +
                  domain::formatRupees(request.preapproved_limit) +
                  ".\n\nTo process this, I need to verify your income. Could "
                  "you please **upload your latest salary slip** or confirm "
                  "your monthly salary?",
              true};

    case domain::Decision::Rejected:
      state_.rejection_reason = result.reason;
      transitionTo(domain::Stage::Rejection);
      return {};
  }
  return {};
}

// -----------------------------------------------------------------------------
// DOCUMENT_COLLECTION: income proof
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::handleDocumentCollection(const std::string& message) {
  Intent intent =
      classifier_.classify(ReplyContext::DocumentResponse, message);

  if (std::holds_alternative<Decline>(intent)) {
    return finish(
        domain::TerminalState::CustomerDropped,
        "I understand. Without income verification, I'm unable to process "
        "this loan amount. You can still apply for a loan within your "
        "pre-approved limit of " +
            domain::formatRupees(state_.preapproved_limit.value_or(0.0)) +
            ". Thank you for your interest in " + kBrand + "!",
        std::string("customer declined to provide income proof"));
  }

  if (const auto* extractable = std::get_if<Extractable>(&intent)) {
    if (auto salary = parseSalaryFigure(extractable->text)) {
      state_.salary = *salary;
      state_.salary_slip_received = true;
      transitionTo(domain::Stage::Underwriting);
      return {"Thank you. I've noted your monthly salary of " +
                  domain::formatRupees(*salary) + ".",
              false};
    }
  } else if (state_.salary && *state_.salary > 0.0) {
    // Upload signal without a figure: use the salary on file.
    state_.salary_slip_received = true;
    transitionTo(domain::Stage::Underwriting);
    return {"Thank you, I've received your salary slip.", false};
  }

  return finish(domain::TerminalState::AdditionalDocumentRequired,
                "I still need your salary details to proceed. Please share "
                "your **monthly salary amount** or **upload your salary "
                "slip**. You can reply later when you have the document "
                "ready.",
                std::string("income proof not provided"));
}

// -----------------------------------------------------------------------------
// SANCTION: document generation (budget-checked, never duplicate-checked)
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep ConversationOrchestrator::handleSanction() {
  SanctionRequest request;
  request.conversation_id = state_.conversation_id;
  request.customer_id = state_.customer_id.value_or("");
  request.customer_name = state_.customer_name.value_or("");
  request.phone = state_.phone.value_or("");
  request.loan_amount = state_.requested_amount.value();
  request.tenure_months = state_.tenure_months.value();
  request.interest_rate = state_.interest_rate.value();
  request.emi = state_.emi.value();
  request.purpose = state_.purpose;

  nlohmann::json inputs = {
      {"customer_id", request.customer_id},
      {"approved_amount", request.loan_amount},
      {"tenure_months", request.tenure_months},
      {"interest_rate", request.interest_rate},
      {"emi", request.emi},
  };
  if (auto refused =
          admit(kDocumentGenerator, inputs, /*check_duplicate=*/false)) {
    return *refused;
  }

  DocumentResult document = collaborators_.documents.generateDocument(request);
  if (document.success) {
    state_.sanction_id = document.document_id;
    state_.document_available = true;
  } else {
    state_.document_available = false;
    std::cerr << "[ConversationOrchestrator] conversation="
              << state_.conversation_id
              << " sanction letter unavailable: " << document.error << "\n";
  }

  std::string text = "**Congratulations, " + request.customer_name +
                     "!**\n\nYour personal loan has been **APPROVED**!\n\n"
                     "**Loan Details:**\n";
  if (state_.sanction_id) {
    text += "- Sanction ID: `" + *state_.sanction_id + "`\n";
  }
  text += "- Approved Amount: **" + domain::formatRupees(request.loan_amount) +
          "**\n"
          "- Tenure: **" + std::to_string(request.tenure_months) +
          " months**\n"
          "- Interest Rate: **" + formatRate(request.interest_rate) +
          "% p.a.**\n"
          "- Monthly EMI: **" + domain::formatRupees(request.emi) + "**\n\n";
  if (!state_.document_available) {
    text += "Your sanction letter could not be generated right now; our team "
            "will share it with you shortly.\n\n";
  }
  text += "The loan amount will be disbursed to your registered bank account "
          "within **24 hours**.\n\nThank you for choosing **" +
          std::string(kBrand) + "**!";

  return finish(domain::TerminalState::LoanSanctioned, std::move(text));
}

// -----------------------------------------------------------------------------
// REJECTION
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::handleRejection() {
  const std::string reason = state_.rejection_reason.value_or(
      "your application did not meet our criteria");

  std::string text = "I'm sorry, " + state_.customer_name.value_or("but") +
                     ", we're unable to approve this loan at this time.\n\n"
                     "**Reason:** " + reason + "\n\n**What you can do:**\n";
  if (state_.suggested_amount && *state_.suggested_amount > 0.0) {
    text += "- Apply for up to " +
            domain::formatRupees(*state_.suggested_amount) +
            ", which fits your income\n";
  }
  text += "- Try applying for a smaller amount within your pre-approved limit\n"
          "- Improve your credit score and reapply after 3-6 months\n"
          "- Contact our customer support for more options\n\n"
          "Thank you for considering " + std::string(kBrand) + ".";

  return finish(domain::TerminalState::LoanRejected, std::move(text), reason);
}

// -----------------------------------------------------------------------------
// END
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep ConversationOrchestrator::handleEnd()
    const {
  if (state_.terminal_state == domain::TerminalState::LoanSanctioned) {
    return {"Your loan has been sanctioned! Is there anything else I can help "
            "you with regarding your loan?",
            true};
  }
  return {"This conversation has ended. If you'd like to start a new loan "
          "application, please start a new conversation. Thank you!",
          true};
}

// -----------------------------------------------------------------------------
// admit(): CallGuard check + record
// -----------------------------------------------------------------------------
std::optional<ConversationOrchestrator::StageStep>
ConversationOrchestrator::admit(const char* agent,
                                const nlohmann::json& inputs,
                                bool check_duplicate) {
  CallGuard& guard = state_.call_guard;
  const std::string hash = computeInputHash(inputs);

  GuardVerdict verdict = GuardVerdict::Allowed;
  if (check_duplicate) {
    verdict = guard.evaluate(agent, hash);
  } else if (guard.budgetExhausted()) {
    verdict = GuardVerdict::BudgetExhausted;
  }

  if (verdict != GuardVerdict::Allowed) {
    return safeguardDrop(agent, verdict);
  }

  guard.recordInvocation(agent, hash);
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// safeguardDrop(): CUSTOMER_DROPPED, stage untouched
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep ConversationOrchestrator::safeguardDrop(
    const std::string& agent, GuardVerdict verdict) {
  const CallGuard& guard = state_.call_guard;

  std::string diagnostic;
  if (verdict == GuardVerdict::DuplicateCall) {
    diagnostic = "repeated " + agent + " call with identical inputs";
  } else {
    diagnostic = "limit of " + std::to_string(guard.maxCalls()) +
                 " automated checks reached";
  }

  std::cerr << "[ConversationOrchestrator] conversation="
            << state_.conversation_id << " safeguard "
            << toString(verdict) << " agent="
            << (agent.empty() ? "-" : agent) << " calls="
            << guard.totalCalls() << "/" << guard.maxCalls() << "\n";

  publish(SafeguardTripEvent{state_.conversation_id, agent, verdict,
                             guard.totalCalls(), now(), nextSequence()});

  state_.terminal_state = domain::TerminalState::CustomerDropped;
  publish(ConversationClosedEvent{state_.conversation_id,
                                  domain::TerminalState::CustomerDropped,
                                  std::nullopt, diagnostic, now(),
                                  nextSequence()});

  return {"We're unable to continue this application (" + diagnostic +
              "). This conversation has been closed; please start a new "
              "application if you'd like to try again.",
          true};
}

// -----------------------------------------------------------------------------
// collaboratorFault()
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep
ConversationOrchestrator::collaboratorFault(const std::exception& error) {
  std::cerr << "[ConversationOrchestrator] conversation="
            << state_.conversation_id << " fault at "
            << domain::toString(state_.stage) << ": " << error.what()
            << "\n";

  return finish(domain::TerminalState::CustomerDropped,
                "I'm sorry, something went wrong on our side while processing "
                "your application. Please try again later.",
                std::string(error.what()));
}

// -----------------------------------------------------------------------------
// finish()
// -----------------------------------------------------------------------------
ConversationOrchestrator::StageStep ConversationOrchestrator::finish(
    domain::TerminalState terminal, std::string text,
    std::optional<std::string> reason) {
  state_.terminal_state = terminal;
  transitionTo(domain::Stage::End);

  publish(ConversationClosedEvent{state_.conversation_id, terminal,
                                  state_.sanction_id, std::move(reason), now(),
                                  nextSequence()});

  std::cout << "[ConversationOrchestrator] conversation="
            << state_.conversation_id
            << " closed: " << domain::toString(terminal) << "\n";

  return {std::move(text), true};
}

// -----------------------------------------------------------------------------
// transitionTo()
// -----------------------------------------------------------------------------
void ConversationOrchestrator::transitionTo(domain::Stage next) {
  if (next == state_.stage) {
    return;
  }
  const domain::Stage from = state_.stage;
  state_.stage = next;

  std::cout << "[ConversationOrchestrator] conversation="
            << state_.conversation_id << " stage " << domain::toString(from)
            << " -> " << domain::toString(next) << "\n";

  publish(StageTransitionEvent{state_.conversation_id, from, next, now(),
                               nextSequence()});
}

Timestamp ConversationOrchestrator::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

void ConversationOrchestrator::publish(const Event& event) {
  if (bus_ != nullptr) {
    bus_->publish(event);
  }
}

}  // namespace lendflow
